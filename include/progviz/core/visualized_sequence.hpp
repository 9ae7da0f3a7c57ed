#pragma once

#include "progviz/common/error_codes.hpp"
#include "progviz/core/run_controller.hpp"
#include <cstddef>
#include <iterator>
#include <utility>

namespace progviz {
namespace core {

// Single-pass view over [first, last) that renders progress before each item is handed out.
// Items are yielded by reference, unmodified and in order.
template<typename Iterator, typename Sentinel = Iterator>
class VisualizedSequence {
public:
    using value_type = typename std::iterator_traits<Iterator>::value_type;
    using reference = typename std::iterator_traits<Iterator>::reference;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = typename VisualizedSequence::value_type;
        using difference_type = std::ptrdiff_t;
        using pointer = typename std::iterator_traits<Iterator>::pointer;
        using reference = typename VisualizedSequence::reference;

        iterator() = default;
        explicit iterator(VisualizedSequence* sequence) : sequence_(sequence) {}

        reference operator*() const { return sequence_->current(); }

        iterator& operator++() {
            sequence_->next();
            return *this;
        }

        bool operator==(const iterator& other) const { return atEnd() == other.atEnd(); }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        VisualizedSequence* sequence_ = nullptr;

        bool atEnd() const { return sequence_ == nullptr || !sequence_->has_current_; }
    };

    VisualizedSequence(Iterator first, Sentinel last, RunController controller)
        : position_(std::move(first)),
          last_(std::move(last)),
          controller_(std::move(controller)) {}

    ~VisualizedSequence() {
        controller_.abandon();
    }

    VisualizedSequence(const VisualizedSequence&) = delete;
    VisualizedSequence& operator=(const VisualizedSequence&) = delete;
    VisualizedSequence(VisualizedSequence&&) = delete;
    VisualizedSequence& operator=(VisualizedSequence&&) = delete;

    iterator begin() {
        if (started_) {
            throw common::SequenceError(common::VisualizerErrorCode::SEQUENCE_ALREADY_CONSUMED);
        }
        next();
        return iterator(this);
    }

    iterator end() { return iterator(); }

    // Advances to the next item, rendering first. Returns false once the source is exhausted.
    bool next() {
        if (controller_.phase() == RunPhase::COMPLETE || controller_.phase() == RunPhase::ABANDONED) {
            has_current_ = false;
            return false;
        }

        has_current_ = false;
        if (!started_) {
            started_ = true;
            controller_.start();
        } else {
            ++position_;
        }

        if (position_ == last_) {
            controller_.finish();
            return false;
        }

        controller_.step();
        has_current_ = true;
        return true;
    }

    reference current() const { return *position_; }

    bool hasCurrent() const { return has_current_; }
    RunPhase phase() const { return controller_.phase(); }
    size_t total() const { return controller_.total(); }
    RunSummary summary() const { return controller_.summary(); }

private:
    Iterator position_;
    Sentinel last_;
    RunController controller_;
    bool started_ = false;
    bool has_current_ = false;
};

}}
