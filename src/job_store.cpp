#include "eqpp/job_store.hpp"

#include "eqpp/errors.hpp"
#include "eqpp/log.hpp"
#include "eqpp/serialization.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <system_error>
#include <utility>

namespace eqpp {

//-----------------------------------------------------------------------------
// InMemoryJobStore
//-----------------------------------------------------------------------------
void
InMemoryJobStore::save(const std::string &id, const JobRecord &record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[id] = record;
}

std::optional<JobRecord>
InMemoryJobStore::load(const std::string &id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) { return std::nullopt; }
    return it->second;
}

std::vector<std::string>
InMemoryJobStore::list_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(records_.size());
    for (const auto &entry : records_) { ids.push_back(entry.first); }
    return ids;
}

//-----------------------------------------------------------------------------
// FileJobStore
//-----------------------------------------------------------------------------
FileJobStore::FileJobStore(std::filesystem::path directory)
  : directory_(std::move(directory)) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) { throw StoreError("Could not create job store directory '" + directory_.string() + "': " + ec.message()); }
}

std::filesystem::path
FileJobStore::path_for(const std::string &id) const {
    // An id must name a file inside the directory.
    if (id.empty() || id.find_first_of("/\\") != std::string::npos || id == "." || id == "..") {
        throw StoreError("Invalid job id for file store: '" + id + "'");
    }
    return directory_ / (id + ".json");
}

void
FileJobStore::save(const std::string &id, const JobRecord &record) {
    const std::filesystem::path target = path_for(id);
    const std::filesystem::path temp = directory_ / (id + ".json.tmp");
    const std::string text = nlohmann::json(record).dump(2);

    std::lock_guard<std::mutex> lock(mutex_);
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) { throw StoreError("Could not open temporary file: " + temp.string()); }
        out << text;
        out.flush();
        if (!out) { throw StoreError("Could not write temporary file: " + temp.string()); }
    }

    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        throw StoreError("Could not move record into place (" + target.string() + "): " + ec.message());
    }
    log::info("FileJobStore", "Saved " + target.string());
}

std::optional<JobRecord>
FileJobStore::load(const std::string &id) const {
    const std::filesystem::path target = path_for(id);

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!std::filesystem::exists(target, ec)) {
        if (ec) { throw StoreError("Could not stat " + target.string() + ": " + ec.message()); }
        return std::nullopt;
    }

    std::ifstream in(target, std::ios::binary);
    if (!in.is_open()) { throw StoreError("Could not open record file: " + target.string()); }

    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return j.get<JobRecord>();
    } catch (const nlohmann::json::exception &e) {
        throw StoreError("Corrupt record file '" + target.string() + "': " + e.what());
    } catch (const std::invalid_argument &e) {
        // InvalidRequestError from the embedded request
        throw StoreError("Corrupt request in record file '" + target.string() + "': " + e.what());
    } catch (const std::runtime_error &e) {
        throw StoreError("Corrupt record file '" + target.string() + "': " + e.what());
    }
}

std::vector<std::string>
FileJobStore::list_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::filesystem::path &p = it->path();
        if (p.extension() == ".json") { ids.push_back(p.stem().string()); }
    }
    if (ec) { throw StoreError("Could not list " + directory_.string() + ": " + ec.message()); }
    return ids;
}

} // namespace eqpp
