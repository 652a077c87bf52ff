#include "eqpp/system_cache.hpp"

#include "eqpp/parser.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace eqpp {

SystemCache::SystemCache(std::size_t capacity)
  : capacity_(capacity == 0 ? 1 : capacity) {}

std::string
SystemCache::make_key(const std::string &source, const BindOptions &options) {
    std::ostringstream oss;
    oss << normalize_source(source) << '|' << options.independent_variable;
    oss << std::setprecision(17);
    for (const auto &param : options.parameters) { oss << '|' << param.first << '=' << param.second; }
    return oss.str();
}

CompiledSystemPtr
SystemCache::get_or_compile(const std::string &source, const BindOptions &options) {
    const std::string key = make_key(source, options);

    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            entry = it->second;
        } else {
            entry = std::make_shared<Entry>();
            entries_.emplace(key, entry);
            insertion_order_.push_back(key);
            evict_locked();
        }
    }

    try {
        std::call_once(entry->once, [&] {
            entry->system = compile_source(source, options);
            std::lock_guard<std::mutex> lock(mutex_);
            ++compilations_;
        });
    } catch (...) {
        // A failed build must not poison the key; drop it and let the error through.
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end() && it->second == entry) {
            entries_.erase(it);
            insertion_order_.erase(std::remove(insertion_order_.begin(), insertion_order_.end(), key),
                                   insertion_order_.end());
        }
        throw;
    }
    return entry->system;
}

void
SystemCache::evict_locked() {
    while (entries_.size() > capacity_ && !insertion_order_.empty()) {
        entries_.erase(insertion_order_.front());
        insertion_order_.pop_front();
    }
}

std::size_t
SystemCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t
SystemCache::compilations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return compilations_;
}

void
SystemCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    insertion_order_.clear();
}

} // namespace eqpp
