#ifndef EQPP_SYSTEM_CACHE_HPP
#define EQPP_SYSTEM_CACHE_HPP

#include "eqpp/compiled_system.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace eqpp {

/**
 * @brief Shares compiled systems between jobs.
 *
 * Keyed by the whitespace-normalized source, the independent variable and the
 * parameter assignment. A key is compiled at most once even when several
 * threads ask for it at the same time; parse/bind errors are not cached.
 * When full, the oldest entry is evicted (jobs already holding it keep their
 * shared_ptr).
 */
class SystemCache {
  public:
    explicit SystemCache(std::size_t capacity = 64);

    /**
     * @throws ParseError, BindError
     */
    CompiledSystemPtr get_or_compile(const std::string &source, const BindOptions &options = {});

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    std::size_t compilations() const;
    void clear();

    static std::string make_key(const std::string &source, const BindOptions &options);

  private:
    struct Entry {
        std::once_flag once;
        CompiledSystemPtr system;
    };

    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
    std::deque<std::string> insertion_order_;
    std::size_t compilations_ = 0;

    void evict_locked();
};

} // namespace eqpp

#endif // EQPP_SYSTEM_CACHE_HPP
