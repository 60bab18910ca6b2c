#pragma once

#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace junction::async
{
static constexpr std::chrono::milliseconds k_default_ttl{120'000};
static constexpr std::chrono::milliseconds k_default_sweep_interval{60'000};

/**
 * @ingroup async
 * @brief A keyed store where every entry expires a fixed time after it was set.
 *
 * Expired entries are found two ways:
 * + `get` and `take` treat an expired entry as missing, and evict it.
 * + A periodic sweep evicts every expired entry, calling `on_expire(key, value)` for each.
 *
 * The sweep runs on the steady timers produced by `timer_factory`; it starts on construction
 * and stops on `shutdown()` (or destruction). Without a timer factory there is no periodic
 * sweep, and `sweep_expired()` must be called explicitly.
 *
 * All members are threadsafe. `on_expire` is called without holding the internal lock, so it
 * may call back into the registry.
 */
template<typename Key, typename Value> class TimedRegistry
{
 public:
   using clock_type         = std::chrono::steady_clock;
   using time_point         = clock_type::time_point;
   using ExpireCallback     = std::function<void(const Key& key, Value value)>;
   using SteadyTimerFactory = std::function<boost::asio::steady_timer()>;

   struct Config
   {
      std::chrono::milliseconds ttl{k_default_ttl};                       //!< Entry lifetime
      std::chrono::milliseconds sweep_interval{k_default_sweep_interval}; //!< Sweep period
   };

 private:
   struct Entry
   {
      Value value;
      time_point expiry;
   };

   struct Pimpl : public std::enable_shared_from_this<Pimpl>
   {
      const Config config;
      const ExpireCallback on_expire;

      mutable std::mutex padlock;
      std::unordered_map<Key, Entry> entries;
      std::optional<boost::asio::steady_timer> timer;
      bool is_shutdown = false;

      Pimpl(Config config_, ExpireCallback on_expire_)
          : config{config_}
          , on_expire{std::move(on_expire_)}
      {}

      // Must hold the padlock
      void schedule_sweep_locked_()
      {
         if(is_shutdown || !timer) return;
         timer->expires_after(config.sweep_interval);
         timer->async_wait([weak = this->weak_from_this()](const boost::system::error_code& ec) {
            if(ec) return; // cancelled
            auto ptr = weak.lock();
            if(ptr != nullptr) {
               ptr->sweep_expired();
               std::lock_guard lock{ptr->padlock};
               ptr->schedule_sweep_locked_();
            }
         });
      }

      std::size_t sweep_expired()
      {
         std::vector<std::pair<Key, Value>> expired;
         { // Evict under the lock, but call back without it
            std::lock_guard lock{padlock};
            if(is_shutdown) return 0;
            const auto now = clock_type::now();
            for(auto ii = begin(entries); ii != end(entries);) {
               if(ii->second.expiry <= now) {
                  expired.emplace_back(ii->first, std::move(ii->second.value));
                  ii = entries.erase(ii);
               } else {
                  ++ii;
               }
            }
         }
         if(on_expire)
            for(auto& [key, value] : expired) on_expire(key, std::move(value));
         return expired.size();
      }

      // Must hold the padlock
      std::optional<Value> find_locked_(const Key& key, bool do_erase)
      {
         auto ii = entries.find(key);
         if(ii == end(entries)) return std::nullopt;
         if(ii->second.expiry <= clock_type::now()) {
            entries.erase(ii);
            return std::nullopt;
         }
         if(!do_erase) return ii->second.value;
         auto value = std::move(ii->second.value);
         entries.erase(ii);
         return value;
      }
   };

   std::shared_ptr<Pimpl> pimpl_;

 public:
   /**
    * @param timer_factory Creates the timer that drives the periodic sweep; may be empty.
    * @param on_expire Called for every entry evicted by the sweep, before it is dropped.
    * @param config TTL and sweep interval.
    */
   TimedRegistry(SteadyTimerFactory timer_factory, ExpireCallback on_expire, Config config = {})
       : pimpl_{std::make_shared<Pimpl>(config, std::move(on_expire))}
   {
      std::lock_guard lock{pimpl_->padlock};
      if(timer_factory) pimpl_->timer.emplace(timer_factory());
      pimpl_->schedule_sweep_locked_();
   }
   TimedRegistry(const TimedRegistry&)            = delete;
   TimedRegistry(TimedRegistry&&)                 = default;
   ~TimedRegistry() { shutdown(); }
   TimedRegistry& operator=(const TimedRegistry&) = delete;
   TimedRegistry& operator=(TimedRegistry&&)      = default;

   const Config& config() const { return pimpl_->config; }

   /**
    * @brief Store `value` under `key`, expiring `ttl` from now. Replaces any existing entry.
    *        Does nothing after `shutdown()`.
    */
   void set(const Key& key, Value value)
   {
      const auto expiry = clock_type::now() + pimpl_->config.ttl;
      std::lock_guard lock{pimpl_->padlock};
      if(pimpl_->is_shutdown) return;
      pimpl_->entries.insert_or_assign(key, Entry{std::move(value), expiry});
   }

   /**
    * @brief The value if present and not expired. An expired entry is evicted (without
    *        calling `on_expire`).
    */
   std::optional<Value> get(const Key& key)
   {
      std::lock_guard lock{pimpl_->padlock};
      return pimpl_->find_locked_(key, false);
   }

   /**
    * @brief Like `get`, but also removes the entry. At most one caller can ever take an entry,
    *        and a taken entry is never passed to `on_expire`.
    */
   std::optional<Value> take(const Key& key)
   {
      std::lock_guard lock{pimpl_->padlock};
      return pimpl_->find_locked_(key, true);
   }

   /**
    * @brief Remove `key` if present. Removing an entry cancels its expiry callback.
    */
   void remove(const Key& key)
   {
      std::lock_guard lock{pimpl_->padlock};
      pimpl_->entries.erase(key);
   }

   bool contains(const Key& key) const
   {
      std::lock_guard lock{pimpl_->padlock};
      return pimpl_->entries.count(key) > 0;
   }

   /**
    * @brief Number of entries, including expired entries that have not been swept.
    */
   std::size_t size() const
   {
      std::lock_guard lock{pimpl_->padlock};
      return pimpl_->entries.size();
   }

   /**
    * @brief Evict all expired entries, calling `on_expire` for each.
    * @return The number of expired entries. Always 0 after `shutdown()`.
    */
   std::size_t sweep_expired() { return pimpl_->sweep_expired(); }

   /**
    * @brief Stop the periodic sweep and drop every entry without calling `on_expire`.
    */
   void shutdown()
   {
      if(pimpl_ == nullptr) return; // moved from
      std::lock_guard lock{pimpl_->padlock};
      if(pimpl_->is_shutdown) return;
      pimpl_->is_shutdown = true;
      pimpl_->entries.clear();
      if(pimpl_->timer) pimpl_->timer->cancel();
   }
};

} // namespace junction::async
