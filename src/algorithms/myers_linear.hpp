#pragma once

// Linear space variant of Myers' difference algorithm.
// O((N+M) D) in time, O(N+M) in space.
// https://blog.jcoglan.com/2017/04/25/myers-diff-in-linear-space-implementation/
//
// The edit graph is split at the middle snake of every box until the boxes
// are trivial. The resulting path is then traced into coalesced edit runs.

#include "algorithm.hpp"
#include "util/bipolar_array.hpp"

#include <optional>
#include <vector>

namespace patchy {

template <typename Unit>
class MyersLinear : public Algorithm<Unit> {
   public:
    explicit MyersLinear(const DiffInput<Unit>& diff_input)
        : Algorithm<Unit>(diff_input), A(diff_input.A), B(diff_input.B) {
    }

   protected:
    DiffResult
    diff() override {
        DiffResult result;

        std::vector<Coordinate> path;
        const Box whole{0, 0, static_cast<int64_t>(A.size()), static_cast<int64_t>(B.size())};
        const bool found = find_path(whole, path);
        if (timed_out_) {
            result.status = DiffResultStatus::TimedOut;
            return result;
        }
        if (!found) {
            return result;
        }

        trace_runs(path, result);

        const bool unchanged = result.runs.size() == 1 && result.runs[0].type == EditType::Common;
        result.status = unchanged ? DiffResultStatus::NoChanges : DiffResultStatus::OK;
        return result;
    }

   private:
    struct Box {
        int64_t left;
        int64_t top;
        int64_t right;
        int64_t bottom;

        int64_t
        width() const {
            return right - left;
        }
        int64_t
        height() const {
            return bottom - top;
        }
        int64_t
        size() const {
            return width() + height();
        }
        int64_t
        delta() const {
            return width() - height();
        }
    };

    // Furthest reaching x (forwards) and y (backwards) per diagonal.
    struct Frontier {
        BipolarArray<int64_t> forward;
        BipolarArray<int64_t> backward;
    };

    static bool
    is_odd(int64_t v) {
        return (v & 1) == 1;
    }

    static bool
    is_between(int64_t v, int64_t low, int64_t high) {
        return v >= low && v <= high;
    }

    // Append the corners of the path through `box` to `out`. Returns false
    // when the box is empty and contributes nothing of its own.
    bool
    find_path(const Box& box, std::vector<Coordinate>& out) {
        assert(box.left >= 0 && box.top >= 0);
        assert(box.right >= box.left && box.bottom >= box.top);

        if (timed_out_) {
            return false;
        }

        auto snake = midpoint(box);
        if (!snake) {
            return false;
        }

        const Coordinate start = snake->from;
        const Coordinate finish = snake->to;

        if (!find_path({box.left, box.top, start.x, start.y}, out)) {
            out.push_back(start);
        }
        if (!find_path({finish.x, finish.y, box.right, box.bottom}, out)) {
            out.push_back(finish);
        }
        return true;
    }

    // The middle snake of `box`, searched from both corners at once.
    std::optional<Move>
    midpoint(const Box& box) {
        if (box.size() == 0) {
            return std::nullopt;
        }

        const int64_t max = (box.size() + 1) / 2;

        Frontier frontier{BipolarArray<int64_t>{-max, max}, BipolarArray<int64_t>{-max, max}};
        frontier.forward[1] = box.left;
        frontier.backward[1] = box.bottom;

        for (int64_t d = 0; d <= max; d++) {
            if (this->deadline_passed()) {
                timed_out_ = true;
                return std::nullopt;
            }
            if (auto snake = forwards(box, frontier, d)) {
                return snake;
            }
            if (auto snake = backwards(box, frontier, d)) {
                return snake;
            }
        }
        return std::nullopt;
    }

    std::optional<Move>
    forwards(const Box& box, Frontier& frontier, int64_t d) {
        auto& vf = frontier.forward;
        auto& vb = frontier.backward;
        for (int64_t k = d; k >= -d; k -= 2) {
            const int64_t c = k - box.delta();

            int64_t px = 0;
            int64_t x = 0;
            if (k == -d || (k != d && vf[k - 1] < vf[k + 1])) {
                px = vf[k + 1];
                x = px;
            } else {
                px = vf[k - 1];
                x = px + 1;
            }

            int64_t y = box.top + (x - box.left) - k;
            const int64_t py = (d == 0 || x != px) ? y : y - 1;

            while (x < box.right && y < box.bottom && A[x] == B[y]) {
                x++;
                y++;
            }
            vf[k] = x;

            if (is_odd(box.delta()) && is_between(c, -(d - 1), d - 1) && y >= vb[c]) {
                return Move{{px, py}, {x, y}};
            }
        }
        return std::nullopt;
    }

    std::optional<Move>
    backwards(const Box& box, Frontier& frontier, int64_t d) {
        auto& vf = frontier.forward;
        auto& vb = frontier.backward;
        for (int64_t c = d; c >= -d; c -= 2) {
            const int64_t k = c + box.delta();

            int64_t py = 0;
            int64_t y = 0;
            if (c == -d || (c != d && vb[c - 1] > vb[c + 1])) {
                py = vb[c + 1];
                y = py;
            } else {
                py = vb[c - 1];
                y = py - 1;
            }

            int64_t x = box.left + (y - box.top) + k;
            const int64_t px = (d == 0 || y != py) ? x : x + 1;

            while (x > box.left && y > box.top && A[x - 1] == B[y - 1]) {
                x--;
                y--;
            }
            vb[c] = y;

            if (!is_odd(box.delta()) && is_between(k, -d, d) && x <= vf[k]) {
                return Move{{x, y}, {px, py}};
            }
        }
        return std::nullopt;
    }

    // Consecutive path corners are joined by at most one diagonal, one
    // horizontal or vertical step, and another diagonal.
    void
    trace_runs(const std::vector<Coordinate>& path, DiffResult& result) const {
        for (size_t i = 0; i + 1 < path.size(); i++) {
            const Coordinate to = path[i + 1];
            Coordinate from = follow_diagonal(path[i], to, result);

            const int64_t xdiff = to.x - from.x;
            const int64_t ydiff = to.y - from.y;
            if (xdiff < ydiff) {
                result.push(EditType::Insert, from.x, from.y, 1);
                from.y++;
            } else if (xdiff > ydiff) {
                result.push(EditType::Delete, from.x, from.y, 1);
                from.x++;
            }
            follow_diagonal(from, to, result);
        }
    }

    Coordinate
    follow_diagonal(Coordinate from, const Coordinate& to, DiffResult& result) const {
        int64_t length = 0;
        while (from.x + length < to.x && from.y + length < to.y && A[from.x + length] == B[from.y + length]) {
            length++;
        }
        result.push(EditType::Common, from.x, from.y, length);
        return {from.x + length, from.y + length};
    }

    gsl::span<const Unit> A;
    gsl::span<const Unit> B;

    // Set once the deadline has passed; the remaining boxes are not searched.
    bool timed_out_ = false;
};

}  // namespace patchy
