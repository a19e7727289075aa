#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "sloup/cli/commands.hpp"
#include "sloup/cli/config.hpp"
#include "sloup/cli/options.hpp"
#include "sloup/core/errors.hpp"
#include "sloup/db/journal.hpp"
#include "sloup/fs/local_fs.hpp"
#include "sloup/storage/swift_client.hpp"
#include "sloup/upload/uploader.hpp"

using sloup::core::Status;
using sloup::core::is_ok;
using sloup::core::u32;
using sloup::core::u64;

namespace {

constexpr u32 kMaxParsedOptions = 32;
constexpr int kProgressWidth = 40;

// ========================================================================
// Logging
// ========================================================================

bool install_logger() {
    try {
        auto logger = spdlog::stderr_color_mt("sloup");
        logger->set_pattern("%^%l%$: %v");
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& e) {
        fprintf(stderr, "error: cannot set up logging: %s\n", e.what());
        return false;
    }
    return true;
}

// ========================================================================
// Error Handling
// ========================================================================

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

void print_status_error(const char* context, Status s) {
    fprintf(stderr, "error: %s failed (%s/%s, aux=%u)\n",
            context,
            sloup::core::status_domain_name(s.domain),
            sloup::core::status_code_name(s.code),
            s.aux);
    if ((s.domain == sloup::core::StatusDomain::Fs || s.domain == sloup::core::StatusDomain::Segment) &&
        s.aux != 0) {
        fprintf(stderr, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
    }
}

// ========================================================================
// Console
// ========================================================================

bool confirm(const char* question, bool assume_yes) {
    if (assume_yes) {
        return true;
    }
    printf("%s [y/N] ", question);
    fflush(stdout);
    char line[16]{};
    if (fgets(line, sizeof(line), stdin) == nullptr) {
        printf("\n");
        return false;
    }
    return line[0] == 'y' || line[0] == 'Y';
}

std::string format_bytes(u64 bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double v = static_cast<double>(bytes);
    int u = 0;
    while (v >= 1024.0 && u < 4) {
        v /= 1024.0;
        ++u;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), u == 0 ? "%.0f %s" : "%.1f %s", v, units[u]);
    return buf;
}

class ProgressBar {
public:
    explicit ProgressBar(u32 total) : total_(total) {}

    void update(const sloup::core::SegmentResult& r, u32 finished) {
        if (r.status != sloup::core::SegmentStatus::Succeeded) {
            ++failed_;
        }
        const int filled = total_ == 0 ? kProgressWidth
                                       : static_cast<int>(static_cast<u64>(finished) * kProgressWidth / total_);
        printf("\r[");
        for (int i = 0; i < kProgressWidth; ++i) {
            putchar(i < filled ? '#' : '.');
        }
        printf("] %u/%u segments", finished, total_);
        if (failed_ > 0) {
            printf(", %u failed", failed_);
        }
        fflush(stdout);
    }

    void finish() {
        printf("\n");
        fflush(stdout);
    }

private:
    u32 total_;
    u32 failed_{0};
};

// ========================================================================
// Argument Helpers
// ========================================================================

struct CommandArgs {
    std::vector<sloup::cli::ParsedOption> storage;
    sloup::cli::ParsedOptions opts{};
    const char* const* positional{nullptr};
    u32 positional_count{0};
};

bool parse_command_args(const sloup::cli::CommandInvocation& cmd, CommandArgs* out) {
    u32 spec_count = 0;
    const sloup::cli::OptionSpec* specs = sloup::cli::upload_option_table(&spec_count);

    out->storage.resize(kMaxParsedOptions);
    out->opts.data = out->storage.data();
    out->opts.cap = kMaxParsedOptions;

    u32 consumed = 0;
    const Status s = sloup::cli::parse_options(cmd.args, specs, spec_count, &out->opts, &consumed);
    if (!is_ok(s)) {
        const u32 at = s.aux < cmd.args.argc ? s.aux : 0;
        fprintf(stderr, "error: %s: bad option '%s'\n", cmd.spec->name,
                cmd.args.argc > 0 ? cmd.args.argv[at] : "");
        return false;
    }
    out->positional = cmd.args.argv + consumed;
    out->positional_count = cmd.args.argc - consumed;

    if (out->positional_count < cmd.spec->positional) {
        fprintf(stderr, "usage: sloup %s\n", cmd.spec->usage);
        return false;
    }
    if (sloup::cli::has_flag(out->opts, sloup::cli::OptionId::Verbose)) {
        spdlog::set_level(spdlog::level::debug);
    }
    return true;
}

const char* env_lookup(const char* name) {
    return std::getenv(name);
}

bool connect(const sloup::cli::ParsedOptions& opts, std::unique_ptr<sloup::storage::SwiftClient>* out) {
    sloup::cli::CredentialConfig creds;
    Status s = sloup::cli::resolve_credentials(opts, &env_lookup, &creds);
    if (!is_ok(s)) {
        print_error("no credentials: use --storage-url/--auth-token, OS_STORAGE_URL/OS_AUTH_TOKEN, "
                    "OS_AUTH_URL/OS_TENANT_NAME/OS_USERNAME/OS_PASSWORD or ST_AUTH/ST_USER/ST_KEY");
        return false;
    }

    sloup::storage::SwiftCredentials swift{creds.storage_url, creds.auth_token};
    switch (creds.method) {
        case sloup::cli::AuthMethod::Token:
            break;
        case sloup::cli::AuthMethod::KeystoneV2:
            s = sloup::storage::authenticate_v2(creds.auth_url, creds.tenant, creds.user, creds.key, &swift);
            break;
        case sloup::cli::AuthMethod::TempAuthV1:
            s = sloup::storage::authenticate_v1(creds.auth_url, creds.user, creds.key, &swift);
            break;
    }
    if (!is_ok(s)) {
        print_status_error("authentication", s);
        return false;
    }

    auto client = std::make_unique<sloup::storage::SwiftClient>(std::move(swift));
    s = client->head_account();
    if (!is_ok(s)) {
        print_status_error("account check", s);
        return false;
    }
    *out = std::move(client);
    return true;
}

void print_plan(const sloup::upload::PreparedUpload& p, u64 max_disk_mb) {
    const auto& plan = p.plan;
    printf("Source:              %s (%s)\n", p.source_path.c_str(), format_bytes(plan.total_size).c_str());
    printf("Object:              %s/%s\n", plan.container.c_str(), plan.object_name.c_str());
    printf("Segments container:  %s\n", plan.segments_container.c_str());
    printf("Segments:            %u x %s%s\n", plan.segment_count, format_bytes(plan.segment_size).c_str(),
           plan.segment_size_adjusted ? " (raised to stay within the segment limit)" : "");
    const char* limit_note = "";
    if (p.concurrency.below_one_segment) {
        limit_note = " (--max-disk-space is smaller than one segment)";
    } else if (p.concurrency.limited_by_disk) {
        limit_note = " (limited by --max-disk-space)";
    }
    printf("Concurrency:         %u%s\n", p.concurrency.effective, limit_note);
    printf("Local disk used:     up to %s", format_bytes(static_cast<u64>(p.concurrency.effective) * plan.segment_size).c_str());
    if (max_disk_mb > 0) {
        printf(" of %s allowed", format_bytes(max_disk_mb * sloup::core::kMiB).c_str());
    }
    printf("\n");
    printf("Work directory:      %s\n", p.work_dir.c_str());
}

void print_indices(const char* label, const std::vector<u32>& indices) {
    printf("%s:", label);
    for (const u32 i : indices) {
        printf(" %u", i);
    }
    printf("\n");
}

// ========================================================================
// Command Handlers
// ========================================================================

void handle_help() {
    u32 count = 0;
    const sloup::cli::CommandSpec* commands = sloup::cli::command_table(&count);
    printf("Usage: sloup <command> [options] [args]\n\n");
    printf("Commands:\n");
    for (u32 i = 0; i < count; ++i) {
        printf("  %s\n", commands[i].usage);
    }
    printf("\n");
    printf("Options:\n");
    printf("  -s, --segment-size MiB     Segment size (default 1)\n");
    printf("  -c, --concurrency N        Parallel segment uploads (default 10)\n");
    printf("  -d, --max-disk-space MiB   Cap on local disk for segment files (0 = none)\n");
    printf("  -t, --temp-dir DIR         Where the sloup-work directory is created (default .)\n");
    printf("      --max-segments N       Segment limit of the cluster (default 1000)\n");
    printf("  -o, --object-name NAME     Object name (default: file name)\n");
    printf("      --storage-url URL      Account URL, or OS_STORAGE_URL\n");
    printf("      --auth-token TOKEN     Auth token, or OS_AUTH_TOKEN\n");
    printf("  -y, --yes                  Do not ask for confirmation\n");
    printf("  -v, --verbose              Debug logging\n");
    printf("\n");
    printf("Without a storage URL and token, Keystone v2 auth uses OS_AUTH_URL, OS_TENANT_NAME,\n");
    printf("OS_USERNAME and OS_PASSWORD; TempAuth uses ST_AUTH, ST_USER and ST_KEY.\n");
}

int handle_plan(const sloup::cli::CommandInvocation& cmd) {
    CommandArgs a;
    if (!parse_command_args(cmd, &a)) return EXIT_FAILURE;

    const char* container = a.positional_count > 1 ? a.positional[1] : "CONTAINER";
    sloup::upload::UploadOptions opts;
    Status s = sloup::cli::build_upload_options(a.opts, a.positional[0], container, &opts);
    if (!is_ok(s)) {
        print_status_error("plan options", s);
        return EXIT_FAILURE;
    }

    sloup::fs::PosixSourceFile file;
    s = file.open(opts.source_path);
    if (!is_ok(s)) {
        print_status_error(opts.source_path.c_str(), s);
        return EXIT_FAILURE;
    }

    sloup::upload::PreparedUpload prepared;
    s = sloup::upload::prepare_upload(opts, file.size(), &prepared);
    if (!is_ok(s)) {
        print_status_error("planning", s);
        return EXIT_FAILURE;
    }
    print_plan(prepared, opts.max_disk_space_mb);
    return EXIT_SUCCESS;
}

int handle_upload(const sloup::cli::CommandInvocation& cmd) {
    CommandArgs a;
    if (!parse_command_args(cmd, &a)) return EXIT_FAILURE;
    const bool assume_yes = sloup::cli::has_flag(a.opts, sloup::cli::OptionId::Yes);

    sloup::upload::UploadOptions opts;
    Status s = sloup::cli::build_upload_options(a.opts, a.positional[0], a.positional[1], &opts);
    if (!is_ok(s)) {
        print_status_error("upload options", s);
        return EXIT_FAILURE;
    }

    sloup::fs::PosixSourceFile file;
    s = file.open(opts.source_path);
    if (!is_ok(s)) {
        print_status_error(opts.source_path.c_str(), s);
        return EXIT_FAILURE;
    }

    sloup::upload::PreparedUpload prepared;
    s = sloup::upload::prepare_upload(opts, file.size(), &prepared);
    if (!is_ok(s)) {
        print_status_error("planning", s);
        return EXIT_FAILURE;
    }

    std::unique_ptr<sloup::storage::SwiftClient> client;
    if (!connect(a.opts, &client)) return EXIT_FAILURE;

    bool exists = false;
    s = client->head_container(opts.container, &exists);
    if (!is_ok(s)) {
        print_status_error("container check", s);
        return EXIT_FAILURE;
    }
    if (!exists) {
        const std::string q = "Container '" + opts.container + "' does not exist. Create it?";
        if (!confirm(q.c_str(), assume_yes)) {
            print_error("upload cancelled");
            return EXIT_FAILURE;
        }
        s = client->create_container(opts.container);
        if (!is_ok(s)) {
            print_status_error("container creation", s);
            return EXIT_FAILURE;
        }
    }

    print_plan(prepared, opts.max_disk_space_mb);
    if (!confirm("Proceed with upload?", assume_yes)) {
        print_error("upload cancelled");
        return EXIT_FAILURE;
    }

    sloup::fs::PosixFs fs;
    ProgressBar bar(prepared.plan.segment_count);
    sloup::upload::UploadDeps deps;
    deps.storage = client.get();
    deps.fs = &fs;
    deps.source = &file;
    deps.on_result = [&bar](const sloup::core::SegmentResult& r, u32 finished, u32) { bar.update(r, finished); };

    const sloup::upload::UploadOutcome out = sloup::upload::execute_upload(prepared, deps);
    bar.finish();

    switch (out.kind) {
        case sloup::upload::OutcomeKind::Success:
            printf("Uploaded %s as %s\n", opts.source_path.c_str(), out.manifest_path.c_str());
            return EXIT_SUCCESS;
        case sloup::upload::OutcomeKind::SegmentFailure:
            print_status_error("segment upload", out.status);
            print_indices("Failed segments", out.failed_indices);
            printf("Work directory kept at %s\n", out.work_dir.c_str());
            return EXIT_FAILURE;
        case sloup::upload::OutcomeKind::ManifestFailure:
            print_status_error("manifest upload", out.status);
            printf("All segments are stored. Retry the manifest with: sloup finalize %s\n",
                   sloup::cli::temp_dir_option(a.opts).c_str());
            return EXIT_FAILURE;
        case sloup::upload::OutcomeKind::PlanningError:
            print_status_error("upload setup", out.status);
            return EXIT_FAILURE;
    }
    return EXIT_FAILURE;
}

int handle_status(const sloup::cli::CommandInvocation& cmd) {
    CommandArgs a;
    if (!parse_command_args(cmd, &a)) return EXIT_FAILURE;

    sloup::upload::UploadOptions for_dir;
    for_dir.temp_dir = a.positional_count > 0 ? a.positional[0] : ".";
    const std::string work_dir = sloup::upload::work_dir_for(for_dir);

    sloup::db::UploadJournal journal;
    Status s = journal.open(sloup::fs::join_path(work_dir, sloup::db::kJournalFileName),
                            sloup::db::OpenMode::Existing);
    if (s.code == sloup::core::StatusCode::NotFound) {
        fprintf(stderr, "error: no upload journal in %s\n", work_dir.c_str());
        return EXIT_FAILURE;
    }
    if (!is_ok(s)) {
        print_status_error("opening journal", s);
        return EXIT_FAILURE;
    }

    sloup::db::JournalUpload upload;
    std::vector<sloup::db::JournalSegment> segments;
    s = journal.load_upload(&upload);
    if (is_ok(s)) {
        s = journal.load_segments(&segments);
    }
    const Status closed = journal.close();
    if (!is_ok(s)) {
        print_status_error("reading journal", s);
        return EXIT_FAILURE;
    }
    if (!is_ok(closed)) {
        print_status_error("closing journal", closed);
    }

    const auto& plan = upload.plan;
    printf("Source:              %s\n", upload.source_path.c_str());
    printf("Object:              %s/%s\n", plan.container.c_str(), plan.object_name.c_str());
    printf("Segments:            %u x %s\n", plan.segment_count, format_bytes(plan.segment_size).c_str());

    for (const auto& seg : segments) {
        if (seg.result.status != sloup::core::SegmentStatus::Succeeded) {
            printf("  segment %u: %s/%s aux=%u\n", seg.result.index,
                   sloup::core::status_domain_name(seg.result.error.domain),
                   sloup::core::status_code_name(seg.result.error.code), seg.result.error.aux);
        }
    }
    const sloup::db::JournalSummary summary = sloup::db::summarize(upload, segments);
    printf("Uploaded:            %u\n", summary.succeeded);
    printf("Failed:              %zu\n", summary.failed.size());
    printf("Not attempted:       %u\n", summary.not_attempted);
    if (!summary.failed.empty()) {
        print_indices("Failed segments", summary.failed);
    }
    return EXIT_SUCCESS;
}

int handle_finalize(const sloup::cli::CommandInvocation& cmd) {
    CommandArgs a;
    if (!parse_command_args(cmd, &a)) return EXIT_FAILURE;

    sloup::upload::UploadOptions for_dir;
    for_dir.temp_dir = a.positional_count > 0 ? a.positional[0] : ".";
    const std::string work_dir = sloup::upload::work_dir_for(for_dir);

    std::unique_ptr<sloup::storage::SwiftClient> client;
    if (!connect(a.opts, &client)) return EXIT_FAILURE;

    sloup::fs::PosixFs fs;
    const sloup::upload::UploadOutcome out = sloup::upload::finalize_upload(work_dir, *client, fs);
    if (out.kind == sloup::upload::OutcomeKind::Success) {
        printf("Stored manifest %s\n", out.manifest_path.c_str());
        return EXIT_SUCCESS;
    }
    print_status_error(sloup::upload::outcome_kind_name(out.kind), out.status);
    if (!out.failed_indices.empty()) {
        print_indices("Failed segments", out.failed_indices);
    }
    return EXIT_FAILURE;
}

} // namespace

int main(int argc, char** argv) {
    if (!install_logger()) {
        return EXIT_FAILURE;
    }
    if (argc < 2) {
        handle_help();
        return EXIT_FAILURE;
    }

    u32 command_count = 0;
    const sloup::cli::CommandSpec* commands = sloup::cli::command_table(&command_count);

    sloup::cli::CommandInvocation cmd;
    u32 consumed = 0;
    const sloup::cli::CliArgs args{argv + 1, static_cast<u32>(argc - 1)};
    Status s = sloup::cli::parse_command(args, commands, command_count, &cmd, &consumed);
    if (!is_ok(s)) {
        fprintf(stderr, "error: unknown command '%s'\n", argv[1]);
        handle_help();
        return EXIT_FAILURE;
    }

    s = sloup::storage::swift_global_init();
    if (!is_ok(s)) {
        print_status_error("curl initialization", s);
        return EXIT_FAILURE;
    }

    int rc = EXIT_FAILURE;
    switch (cmd.id) {
        case sloup::cli::CommandId::Help:
            handle_help();
            rc = EXIT_SUCCESS;
            break;
        case sloup::cli::CommandId::Upload:
            rc = handle_upload(cmd);
            break;
        case sloup::cli::CommandId::Plan:
            rc = handle_plan(cmd);
            break;
        case sloup::cli::CommandId::Status:
            rc = handle_status(cmd);
            break;
        case sloup::cli::CommandId::Finalize:
            rc = handle_finalize(cmd);
            break;
        case sloup::cli::CommandId::None:
            print_error("unknown command");
            break;
    }

    sloup::storage::swift_global_cleanup();
    spdlog::shutdown();
    return rc;
}
