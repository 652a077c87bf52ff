#ifndef EQPP_JOB_STORE_HPP
#define EQPP_JOB_STORE_HPP

#include "eqpp/job.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace eqpp {

/**
 * @brief Abstract base class for job record persistence.
 *
 * Implementations must be safe to call from several threads. Failures are
 * reported as StoreError.
 */
class JobStore {
  public:
    virtual ~JobStore() = default;

    /**
     * @brief Inserts or replaces the record stored under `id`.
     * @throws StoreError
     */
    virtual void save(const std::string &id, const JobRecord &record) = 0;

    /**
     * @return the record, or std::nullopt if none was ever saved under `id`.
     * @throws StoreError if a record exists but cannot be read.
     */
    virtual std::optional<JobRecord> load(const std::string &id) const = 0;

    virtual std::vector<std::string> list_ids() const = 0;

    virtual std::string name() const = 0;
};

class InMemoryJobStore : public JobStore {
  public:
    void save(const std::string &id, const JobRecord &record) override;
    std::optional<JobRecord> load(const std::string &id) const override;
    std::vector<std::string> list_ids() const override;
    std::string name() const override { return "InMemoryJobStore"; }

  private:
    mutable std::mutex mutex_;
    std::map<std::string, JobRecord> records_;
};

/**
 * @brief One JSON document per job, <directory>/<id>.json. Each save writes a
 * temporary file and renames it over the old one, so a reader never sees a
 * half-written record.
 */
class FileJobStore : public JobStore {
  public:
    /**
     * @throws StoreError if the directory cannot be created.
     */
    explicit FileJobStore(std::filesystem::path directory);

    void save(const std::string &id, const JobRecord &record) override;
    std::optional<JobRecord> load(const std::string &id) const override;
    std::vector<std::string> list_ids() const override;
    std::string name() const override { return "FileJobStore"; }

    const std::filesystem::path &directory() const { return directory_; }

  private:
    std::filesystem::path path_for(const std::string &id) const;

    std::filesystem::path directory_;
    mutable std::mutex mutex_;
};

} // namespace eqpp

#endif // EQPP_JOB_STORE_HPP
