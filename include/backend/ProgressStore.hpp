#pragma once

#include "model/Records.hpp"
#include "util/Clock.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace folio::backend {

// Local-first progress persistence. Writes are best effort: a false return
// is logged by the caller and retried on the next save.
class ProgressGateway {
public:
    virtual ~ProgressGateway() = default;

    virtual bool save_local(const std::string& item_id, double position, double duration, bool is_finished) = 0;
    [[nodiscard]] virtual std::optional<double> get_local(const std::string& item_id) = 0;
    [[nodiscard]] virtual std::optional<model::ProgressRecord> get_local_record(const std::string& item_id) = 0;
    virtual bool mark_synced(const std::string& item_id) = 0;
    [[nodiscard]] virtual std::vector<model::ProgressRecord> get_unsynced() = 0;
};

// Keeps every record in memory and writes the whole set through to one
// binary file on each change. Records are overwritten, never removed.
class FileProgressStore : public ProgressGateway {
public:
    FileProgressStore(std::filesystem::path file, const util::Clock& clock);

    // Reads the file if it exists. A missing file is an empty store.
    bool load();

    bool save_local(const std::string& item_id, double position, double duration, bool is_finished) override;
    std::optional<double> get_local(const std::string& item_id) override;
    std::optional<model::ProgressRecord> get_local_record(const std::string& item_id) override;
    bool mark_synced(const std::string& item_id) override;
    std::vector<model::ProgressRecord> get_unsynced() override;

    [[nodiscard]] size_t size() const { return records_.size(); }

private:
    bool flush();

    static constexpr uint64_t PROGRESS_MAGIC = 0x464F4C494F505231ULL;  // 'FOLIOPR1'
    static constexpr uint32_t FORMAT_VERSION = 1;

    std::filesystem::path file_;
    const util::Clock& clock_;
    std::map<std::string, model::ProgressRecord> records_;
};

}  // namespace folio::backend
