#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "config.hpp"

namespace JsonScribe {

enum class ContextKind : std::uint8_t {
    ARRAY,
    OBJECT,
    STRING_VALUE
};

/// One open JSON construct and what the next write inside it has to emit first.
struct ContextFrame {
    ContextKind kind = ContextKind::ARRAY;
    bool hasEmittedFirstChild = false;
    bool awaitingKey = false;   // objects only: true between a value and the next key
    std::size_t id = 0;         // open sequence number, never reused within one scribe
};

constexpr char closing_delimiter(ContextKind kind) {
    switch(kind) {
    case ContextKind::ARRAY: return ']';
    case ContextKind::OBJECT: return '}';
    case ContextKind::STRING_VALUE: return '"';
    }
    return '\0';
}

// ============================================================================
// ContextStackLike Concept
// ============================================================================

/// push() returns false when the stack is at capacity; pop() and top() are only
/// called on a non-empty stack, at(i) with i < size() (0 is the outermost frame).
template<typename T>
concept ContextStackLike = requires(T& stack, const T& cstack, const ContextFrame& frame) {
    { stack.push(frame) } -> std::same_as<bool>;
    { stack.pop() } -> std::same_as<ContextFrame>;
    { stack.top() } -> std::same_as<ContextFrame&>;
    { cstack.at(std::size_t{}) } -> std::same_as<const ContextFrame&>;
    { cstack.size() } -> std::convertible_to<std::size_t>;
    { cstack.empty() } -> std::same_as<bool>;
    { cstack.full() } -> std::same_as<bool>;
};

// ============================================================================
// ContextStack - bounded stack of open contexts
// ============================================================================

/// Template parameters:
///   MaxDepth - deepest nesting accepted (required, no default)
///   dynamic  - If true, frames live in a std::vector that grows up to MaxDepth
///              If false, frames live in a std::array (no allocation)
///
/// Examples:
///   ContextStack<16>          - 16 levels, fixed storage, embedded friendly
///   ContextStack<512, true>   - up to 512 levels, allocated on demand
template<std::size_t MaxDepth, bool dynamic = false>
class ContextStack;

template<std::size_t MaxDepth>
class ContextStack<MaxDepth, false> {
    std::array<ContextFrame, MaxDepth> frames_{};
    std::size_t size_ = 0;

public:
    constexpr ContextStack() = default;

    constexpr bool push(const ContextFrame& frame) {
        if (size_ == MaxDepth) {
            return false;
        }
        frames_[size_++] = frame;
        return true;
    }

    constexpr ContextFrame pop() {
        return frames_[--size_];
    }

    constexpr ContextFrame& top() {
        return frames_[size_ - 1];
    }

    constexpr const ContextFrame& at(std::size_t index) const {
        return frames_[index];
    }

    constexpr std::size_t size() const { return size_; }
    constexpr bool empty() const { return size_ == 0; }
    constexpr bool full() const { return size_ == MaxDepth; }
    static constexpr std::size_t max_depth() { return MaxDepth; }
};

template<std::size_t MaxDepth>
class ContextStack<MaxDepth, true> {
    std::vector<ContextFrame> frames_;

public:
    constexpr ContextStack() = default;

    constexpr bool push(const ContextFrame& frame) {
        if (frames_.size() == MaxDepth) {
            return false;
        }
        frames_.push_back(frame);
        return true;
    }

    constexpr ContextFrame pop() {
        ContextFrame frame = frames_.back();
        frames_.pop_back();
        return frame;
    }

    constexpr ContextFrame& top() {
        return frames_.back();
    }

    constexpr const ContextFrame& at(std::size_t index) const {
        return frames_[index];
    }

    constexpr std::size_t size() const { return frames_.size(); }
    constexpr bool empty() const { return frames_.empty(); }
    constexpr bool full() const { return frames_.size() == MaxDepth; }
    static constexpr std::size_t max_depth() { return MaxDepth; }
};

using DefaultContextStack = ContextStack<DefaultMaxDepth, true>;

static_assert(ContextStackLike<ContextStack<16>>, "ContextStack<16> should satisfy ContextStackLike");
static_assert(ContextStackLike<ContextStack<16, true>>, "ContextStack<16, true> should satisfy ContextStackLike");
static_assert(ContextStackLike<DefaultContextStack>, "DefaultContextStack should satisfy ContextStackLike");

} // namespace JsonScribe
