#pragma once

#include <cassert>
#include <chrono>
#include <cinttypes>
#include <cstddef>
#include <gsl/span>
#include <optional>
#include <vector>

namespace patchy {

using std::int64_t;
using std::size_t;

// A point in the edit graph: x indexes A, y indexes B.
struct Coordinate {
    int64_t x;
    int64_t y;
};

struct Move {
    Coordinate from;
    Coordinate to;
};

enum class EditType {
    Delete,
    Insert,
    Common,
};

// `length` consecutive units of the same kind. A Delete run covers
// A[a_begin, a_begin + length), an Insert run B[b_begin, b_begin + length),
// a Common run both.
struct EditRun {
    EditType type;
    int64_t a_begin;
    int64_t b_begin;
    int64_t length;
};

enum class DiffResultStatus {
    OK,
    Failed,
    NoChanges,
    TimedOut,
};

using Clock = std::chrono::steady_clock;

// No deadline means the algorithm may run until it is done.
using Deadline = std::optional<Clock::time_point>;

template <typename Unit>
struct DiffInput {
    gsl::span<const Unit> A;
    gsl::span<const Unit> B;

    Deadline deadline;
};

struct DiffResult {
    DiffResultStatus status = DiffResultStatus::Failed;
    std::vector<EditRun> runs;

    // Extend the last run when it continues with the same kind of edit.
    void
    push(EditType type, int64_t a, int64_t b, int64_t length) {
        if (length <= 0) {
            return;
        }
        if (!runs.empty()) {
            auto& last = runs.back();
            const bool adjacent_a = type == EditType::Insert || last.a_begin + span_a(last) == a;
            const bool adjacent_b = type == EditType::Delete || last.b_begin + span_b(last) == b;
            if (last.type == type && adjacent_a && adjacent_b) {
                last.length += length;
                return;
            }
        }
        runs.push_back({type, a, b, length});
    }

    static int64_t
    span_a(const EditRun& run) {
        return run.type == EditType::Insert ? 0 : run.length;
    }

    static int64_t
    span_b(const EditRun& run) {
        return run.type == EditType::Delete ? 0 : run.length;
    }
};

template <typename Unit>
class Algorithm {
   public:
    explicit Algorithm(const DiffInput<Unit>& diff_input) : diff_input_(diff_input) {
    }

    virtual ~Algorithm() = default;

    DiffResult
    compute() {
        const auto N = static_cast<int64_t>(diff_input_.A.size());
        const auto M = static_cast<int64_t>(diff_input_.B.size());

        DiffResult result;
        if (N == 0 && M == 0) {
            result.status = DiffResultStatus::NoChanges;
            return result;
        }
        if (N == 0 || M == 0) {
            // One side is empty; everything on the other side changed.
            result.push(EditType::Delete, 0, 0, N);
            result.push(EditType::Insert, N, 0, M);
            result.status = DiffResultStatus::OK;
            return result;
        }
        return diff();
    }

   protected:
    virtual DiffResult
    diff() = 0;

    bool
    deadline_passed() const {
        return diff_input_.deadline && Clock::now() > *diff_input_.deadline;
    }

    const DiffInput<Unit>& diff_input_;
};

}  // namespace patchy
