#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace ferry
{

    using ListenerId = std::size_t;

    // Synchronous publish/subscribe channel. Listeners run in registration order.
    template <typename... Args>
    class ListenerList
    {
    public:
        using Listener = std::function<void(Args...)>;

        ListenerId add(Listener listener)
        {
            const auto id = next_id_++;
            entries_.push_back(Entry{id, std::move(listener)});
            return id;
        }

        bool remove(ListenerId id)
        {
            const auto it = std::find_if(entries_.begin(), entries_.end(), [id](const Entry &entry)
                                         { return entry.id == id; });
            if (it == entries_.end())
            {
                return false;
            }
            entries_.erase(it);
            return true;
        }

        void emit(Args... args) const
        {
            // listeners may subscribe or unsubscribe while being notified
            const auto snapshot = entries_;
            for (const auto &entry : snapshot)
            {
                entry.listener(args...);
            }
        }

        std::size_t size() const noexcept { return entries_.size(); }
        bool empty() const noexcept { return entries_.empty(); }

    private:
        struct Entry
        {
            ListenerId id;
            Listener listener;
        };

        std::vector<Entry> entries_;
        ListenerId next_id_{1};
    };

} // namespace ferry
