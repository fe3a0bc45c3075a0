#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace rayshell
{

// Bounded multi-producer multi-consumer broadcast queue. Every subscribed
// receiver sees every message sent while it is subscribed, in the order each
// sender sent them. A message is released once all receivers have read it.
//
// Handles are cheap to copy: copying a sender or receiver subscribes a new
// endpoint. A receiver copy starts at the same read position as its source.
// A single handle must not be used from two threads at once.

enum class TrySendResult
{
    Ok,
    Full,           // the slowest receiver is `capacity` messages behind
    Disconnected,   // no receiver is subscribed
};

enum class TryRecvResult
{
    Ok,
    Empty,          // nothing queued for this receiver right now
    Disconnected,   // nothing queued and no sender is subscribed
};

namespace detail
{

template <typename T>
struct BroadcastState
{
    explicit BroadcastState(size_t cap) : capacity(cap) {}

    // Drop messages every receiver has already read.
    void collect_locked()
    {
        if (receivers.empty())
        {
            head_seq += buffer.size();
            buffer.clear();
            return;
        }
        uint64_t min_cursor = UINT64_MAX;
        for (const auto& [id, cursor] : receivers)
            min_cursor = std::min(min_cursor, cursor);
        while (!buffer.empty() && head_seq < min_cursor)
        {
            buffer.pop_front();
            ++head_seq;
        }
    }

    uint64_t tail_seq() const { return head_seq + buffer.size(); }

    std::mutex                             mu;
    const size_t                           capacity;
    std::deque<T>                          buffer;
    uint64_t                               head_seq = 0;
    std::unordered_map<uint64_t, uint64_t> receivers;   // id -> next sequence to read
    uint64_t                               next_receiver_id = 0;
    size_t                                 senders          = 0;
};

}   // namespace detail

template <typename T>
class BroadcastSender
{
   public:
    BroadcastSender() = default;

    explicit BroadcastSender(std::shared_ptr<detail::BroadcastState<T>> state)
        : state_(std::move(state))
    {
        std::lock_guard<std::mutex> lock(state_->mu);
        ++state_->senders;
    }

    BroadcastSender(const BroadcastSender& other) : state_(other.state_)
    {
        if (state_)
        {
            std::lock_guard<std::mutex> lock(state_->mu);
            ++state_->senders;
        }
    }

    BroadcastSender& operator=(const BroadcastSender& other)
    {
        if (this != &other)
        {
            BroadcastSender copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    BroadcastSender(BroadcastSender&& other) noexcept : state_(std::move(other.state_)) {}

    BroadcastSender& operator=(BroadcastSender&& other) noexcept
    {
        if (this != &other)
        {
            unsubscribe();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    ~BroadcastSender() { unsubscribe(); }

    TrySendResult try_send(T value)
    {
        if (!state_)
            return TrySendResult::Disconnected;

        std::lock_guard<std::mutex> lock(state_->mu);
        if (state_->receivers.empty())
            return TrySendResult::Disconnected;

        state_->collect_locked();
        if (state_->buffer.size() >= state_->capacity)
            return TrySendResult::Full;

        state_->buffer.push_back(std::move(value));
        return TrySendResult::Ok;
    }

    // Detach this endpoint. Safe to call more than once.
    void unsubscribe()
    {
        if (!state_)
            return;
        {
            std::lock_guard<std::mutex> lock(state_->mu);
            --state_->senders;
        }
        state_.reset();
    }

    bool is_subscribed() const { return static_cast<bool>(state_); }

    size_t receiver_count() const
    {
        if (!state_)
            return 0;
        std::lock_guard<std::mutex> lock(state_->mu);
        return state_->receivers.size();
    }

   private:
    std::shared_ptr<detail::BroadcastState<T>> state_;
};

template <typename T>
class BroadcastReceiver
{
   public:
    BroadcastReceiver() = default;

    explicit BroadcastReceiver(std::shared_ptr<detail::BroadcastState<T>> state)
        : state_(std::move(state))
    {
        std::lock_guard<std::mutex> lock(state_->mu);
        id_                     = state_->next_receiver_id++;
        state_->receivers[id_] = state_->tail_seq();
    }

    BroadcastReceiver(const BroadcastReceiver& other) : state_(other.state_)
    {
        if (state_)
        {
            std::lock_guard<std::mutex> lock(state_->mu);
            id_                     = state_->next_receiver_id++;
            state_->receivers[id_] = state_->receivers.at(other.id_);
        }
    }

    BroadcastReceiver& operator=(const BroadcastReceiver& other)
    {
        if (this != &other)
        {
            BroadcastReceiver copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    BroadcastReceiver(BroadcastReceiver&& other) noexcept
        : state_(std::move(other.state_)), id_(other.id_)
    {
    }

    BroadcastReceiver& operator=(BroadcastReceiver&& other) noexcept
    {
        if (this != &other)
        {
            unsubscribe();
            state_ = std::move(other.state_);
            id_    = other.id_;
        }
        return *this;
    }

    ~BroadcastReceiver() { unsubscribe(); }

    // Non-blocking. On Ok the next message is copied into `out`.
    TryRecvResult try_recv(T& out)
    {
        if (!state_)
            return TryRecvResult::Disconnected;

        std::lock_guard<std::mutex> lock(state_->mu);
        auto& cursor = state_->receivers.at(id_);
        if (cursor < state_->tail_seq())
        {
            out = state_->buffer[static_cast<size_t>(cursor - state_->head_seq)];
            ++cursor;
            state_->collect_locked();
            return TryRecvResult::Ok;
        }
        return state_->senders == 0 ? TryRecvResult::Disconnected : TryRecvResult::Empty;
    }

    // Detach this endpoint. Safe to call more than once.
    void unsubscribe()
    {
        if (!state_)
            return;
        {
            std::lock_guard<std::mutex> lock(state_->mu);
            state_->receivers.erase(id_);
            state_->collect_locked();
        }
        state_.reset();
    }

    bool is_subscribed() const { return static_cast<bool>(state_); }

    // Messages queued for this receiver.
    size_t pending() const
    {
        if (!state_)
            return 0;
        std::lock_guard<std::mutex> lock(state_->mu);
        return static_cast<size_t>(state_->tail_seq() - state_->receivers.at(id_));
    }

    size_t sender_count() const
    {
        if (!state_)
            return 0;
        std::lock_guard<std::mutex> lock(state_->mu);
        return state_->senders;
    }

   private:
    std::shared_ptr<detail::BroadcastState<T>> state_;
    uint64_t                                   id_ = 0;
};

// Create a channel with one sender and one receiver subscribed.
template <typename T>
std::pair<BroadcastSender<T>, BroadcastReceiver<T>> make_broadcast_channel(size_t capacity)
{
    auto state = std::make_shared<detail::BroadcastState<T>>(capacity);
    return {BroadcastSender<T>(state), BroadcastReceiver<T>(state)};
}

}   // namespace rayshell
