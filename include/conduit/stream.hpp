// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Lazy Element Stream                                               ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <stop_token>
#include <utility>
#include <vector>

namespace conduit {

/// Lazy, pull-based sequence of elements produced by a stream handler.
///
/// The producer is called once per element and returns std::nullopt when the
/// sequence is exhausted. The stop token is checked at every element boundary:
/// after a stop request no further element is produced and next() returns
/// std::nullopt. Copies share the same underlying position.
template<typename T>
class Stream {
public:
    using value_type = T;
    using Producer = std::function<std::optional<T>()>;

    Stream() = default;

    explicit Stream(Producer producer, std::stop_token token = {})
        : state_(std::make_shared<State>(std::move(producer), std::move(token))) {}

    /// Stream over an already materialized sequence
    [[nodiscard]] static Stream from_vector(std::vector<T> items, std::stop_token token = {}) {
        auto storage = std::make_shared<std::vector<T>>(std::move(items));
        auto index = std::make_shared<std::size_t>(0);
        return Stream([storage, index]() -> std::optional<T> {
            if (*index >= storage->size()) {
                return std::nullopt;
            }
            return (*storage)[(*index)++];
        }, std::move(token));
    }

    /// Produce the next element, std::nullopt when finished or cancelled
    [[nodiscard]] std::optional<T> next() {
        if (!state_ || state_->finished) {
            return std::nullopt;
        }
        if (state_->token.stop_requested()) {
            state_->finished = true;
            state_->cancelled = true;
            return std::nullopt;
        }
        auto item = state_->producer();
        if (!item) {
            state_->finished = true;
            return std::nullopt;
        }
        ++state_->produced;
        return item;
    }

    /// Same sequence, additionally stopped by `token`
    [[nodiscard]] Stream with_cancellation(std::stop_token token) const {
        auto inner = *this;
        return Stream([inner]() mutable { return inner.next(); }, std::move(token));
    }

    /// Drain the remaining elements
    [[nodiscard]] std::vector<T> collect() {
        std::vector<T> items;
        while (auto item = next()) {
            items.push_back(std::move(*item));
        }
        return items;
    }

    [[nodiscard]] bool finished() const noexcept { return !state_ || state_->finished; }
    [[nodiscard]] bool cancelled() const noexcept { return state_ && state_->cancelled; }
    [[nodiscard]] std::size_t produced() const noexcept { return state_ ? state_->produced : 0; }

    // ==========================================================================
    // Range support
    // ==========================================================================

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        iterator() = default;

        explicit iterator(Stream* stream) : stream_(stream) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        void operator++(int) { advance(); }

        bool operator==(const iterator& other) const noexcept {
            return at_end() == other.at_end();
        }

        bool operator!=(const iterator& other) const noexcept { return !(*this == other); }

    private:
        void advance() {
            current_ = stream_ ? stream_->next() : std::nullopt;
        }

        [[nodiscard]] bool at_end() const noexcept { return !current_.has_value(); }

        Stream* stream_{nullptr};
        std::optional<T> current_;
    };

    [[nodiscard]] iterator begin() { return iterator(this); }
    [[nodiscard]] iterator end() { return iterator(); }

private:
    struct State {
        State(Producer p, std::stop_token t)
            : producer(std::move(p)), token(std::move(t)) {}

        Producer producer;
        std::stop_token token;
        bool finished{false};
        bool cancelled{false};
        std::size_t produced{0};
    };

    std::shared_ptr<State> state_;
};

} // namespace conduit
