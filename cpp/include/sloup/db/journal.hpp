#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "sloup/core/errors.hpp"
#include "sloup/core/models.hpp"
#include "sloup/core/types.hpp"

struct sqlite3;

namespace sloup::db {
    using u32 = sloup::core::u32;

    struct JournalUpload {
        sloup::core::UploadPlan plan;
        std::string source_path;
        sloup::core::Timestamp started_at{0};
    };

    struct JournalSegment {
        sloup::core::SegmentResult result;
        sloup::core::Timestamp finished_at{0};
    };

    struct JournalSummary {
        u32 succeeded{0};
        u32 not_attempted{0};        // recorded segment_count minus rows, never negative
        std::vector<u32> failed;     // ascending
    };

    JournalSummary summarize(const JournalUpload& upload, const std::vector<JournalSegment>& segments);

    enum class OpenMode {
        Create,    // create the file if needed and apply the schema
        Existing,  // open a retained journal; never creates a file
    };

    // Per-upload record of what reached the object store, kept in the work
    // directory. Survives failed runs so they can be inspected or finalized.
    class UploadJournal {
    public:
        UploadJournal() noexcept = default;
        ~UploadJournal() noexcept;

        UploadJournal(const UploadJournal&) = delete;
        UploadJournal& operator=(const UploadJournal&) = delete;

        // Existing mode returns Journal/NotFound when `path` does not exist.
        [[nodiscard]] sloup::core::Status open(const std::string& path, OpenMode mode = OpenMode::Create) noexcept;
        [[nodiscard]] sloup::core::Status close() noexcept;
        [[nodiscard]] bool is_open() const noexcept;

        // Replaces the upload row and clears segment rows from earlier runs.
        [[nodiscard]] sloup::core::Status record_upload(const sloup::core::UploadPlan& plan,
            const std::string& source_path) noexcept;

        // Insert or replace by index.
        [[nodiscard]] sloup::core::Status record_segment(const sloup::core::SegmentResult& result) noexcept;

        // NotFound if no upload was recorded.
        [[nodiscard]] sloup::core::Status load_upload(JournalUpload* out) noexcept;

        // Ordered by index.
        [[nodiscard]] sloup::core::Status load_segments(std::vector<JournalSegment>* out) noexcept;

    private:
        mutable std::mutex mutex_;
        sqlite3* db_{nullptr};
    };

    inline constexpr const char* kJournalFileName = "journal.db";

} // namespace sloup::db
