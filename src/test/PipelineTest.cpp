#include <functional>
#include <iostream>
#include <map>
#include <stdexcept>
#include "../core/cancel.hpp"
#include "../core/executor.hpp"
#include "../core/hooks.hpp"
#include "../core/metadata.hpp"
#include "../core/pipeline.hpp"
#include "../defs.hpp"
#include "test_support.hpp"

using namespace offload;
using namespace offload_test;

class FakeProbe : public StoreProbe {
public:
    explicit FakeProbe(bool up) : up_(up) {}
    bool probe(std::string& detail) override {
        detail = up_ ? "store up" : "store down";
        return up_;
    }

private:
    bool up_;
};

class RecordingNotifier : public Notifier {
public:
    bool notify(const RunReport& report) override {
        states.push_back(report.state);
        kinds.push_back(report.failure_kind);
        return true;
    }
    std::vector<PipelineState> states;
    std::vector<std::optional<ErrorKind>> kinds;
};

class ScriptedGate : public ConfirmationGate {
public:
    ScriptedGate(bool answer, std::function<void()> side_effect = nullptr)
        : answer_(answer), side_effect_(std::move(side_effect)) {}
    bool confirm(const RunSummary& summary) override {
        seen = summary;
        calls++;
        if (side_effect_)
            side_effect_();
        return answer_;
    }
    RunSummary seen;
    int calls = 0;

private:
    bool answer_;
    std::function<void()> side_effect_;
};

struct Fixture {
    ScratchDir scratch{"offload-pipeline"};
    fs::path card = scratch.path() / "card";
    fs::path store = scratch.path() / "Photos";
    fs::path staging = scratch.path() / "staging";
    Config config;
    ProfileSet profiles = test_profiles();
    EmbeddedTagReader reader;
    std::map<std::string, std::string> original;

    explicit Fixture(const std::string& model = "ILCE-7C") {
        make_sony_card(card, model);
        for (const char* rel : {"DCIM/100MSDCF/DSC00001.ARW", "DCIM/100MSDCF/DSC00002.ARW",
                                "DCIM/100MSDCF/DSC00003.JPG", "PRIVATE/M4ROOT/CLIP/C0001.MP4"}) {
            original[rel] = read_file(card / rel);
        }
        fs::create_directories(store);
        config = Config::make_default();
        config.profiles_file.clear();
        config.store_root = store;
        config.staging_root = staging;
        config.audit_dir = scratch.path() / "audit";
        config.log_file.clear();
        config.transfer_retries = 2;
        config.retry_backoff_ms = 1;
        config.digest_workers = 2;
    }

    fs::path day(const fs::path& root) const { return root / "Sony A7C" / today_stamp(); }
};

// Every media file still on the card, byte for byte
static bool card_intact(const Fixture& f) {
    for (const auto& [rel, data] : f.original) {
        if (!fs::is_regular_file(f.card / rel) || read_file(f.card / rel) != data)
            return false;
    }
    return true;
}

static bool visited(const RunReport& report, PipelineState state) {
    for (const auto& t : report.transitions) {
        if (t.state == state)
            return true;
    }
    return false;
}

static void testFullRunWithCleanup() {
    std::cout << "[Test] Scenario A: full run with cleanup..." << std::endl;
    Fixture f;
    f.config.delete_after_verify = true;
    std::string clip = read_file(f.card / "PRIVATE/M4ROOT/CLIP/C0001.MP4");

    FakeProbe probe(true);
    RecordingNotifier notifier;
    Collaborators hooks;
    hooks.notifier = &notifier;
    Orchestrator orchestrator(f.config, f.profiles, f.reader, probe, hooks);
    RunReport report = orchestrator.run(f.card);

    expect(report.state == PipelineState::Done && report.exit_code() == EXIT_OK, "run Done");
    expect(report.profile == "Sony A7C", "Sony A7C identified");
    expect(report.day_folder == f.day(f.store), "store day-folder used");
    expect(read_file(f.day(f.store) / "PRIVATE/M4ROOT/CLIP/C0001.MP4") == clip,
           "clip landed under PRIVATE/M4ROOT/CLIP");
    expect(fs::exists(f.day(f.store) / "DCIM/100MSDCF/DSC00001.ARW"), "photo landed under DCIM");
    expect(report.verification && report.verification->passed, "verification passed");
    expect(report.cleanup_performed && report.deleted == 4, "source media deleted");
    expect(!fs::exists(f.card / "DCIM/100MSDCF/DSC00001.ARW"), "card photo gone");
    expect(fs::exists(report.audit_path), "audit record on disk");
    expect(!is_import_incomplete(f.day(f.store)), "import marked complete");

    std::vector<PipelineState> expected{PipelineState::Idle,         PipelineState::Identifying,
                                        PipelineState::CheckingCollision, PipelineState::Routing,
                                        PipelineState::Transferring, PipelineState::Verifying,
                                        PipelineState::CleaningUp,   PipelineState::Done};
    bool ordered = report.transitions.size() == expected.size();
    for (size_t i = 0; ordered && i < expected.size(); ++i) {
        ordered = report.transitions[i].state == expected[i];
    }
    expect(ordered, "every stage visited in order");
    expect(notifier.states.size() == 1 && notifier.states[0] == PipelineState::Done,
           "notifier told about Done");
    expect(report.to_json().find("\"state\": \"Done\"") != std::string::npos, "report JSON");

    bool reused = false;
    try {
        orchestrator.run(f.card);
    } catch (const std::logic_error&) {
        reused = true;
    }
    expect(reused, "an orchestrator runs once");
}

static void testRunKeepsSourceByDefault() {
    std::cout << "[Test] Run without delete policy..." << std::endl;
    Fixture f;
    FakeProbe probe(true);
    Orchestrator orchestrator(f.config, f.profiles, f.reader, probe);
    RunReport report = orchestrator.run(f.card);

    expect(report.succeeded(), "run Done");
    expect(card_intact(f), "card untouched");
    expect(!report.cleanup_performed, "no cleanup");
    expect(!visited(report, PipelineState::CleaningUp), "CleaningUp skipped");
}

static void testUnknownCamera() {
    std::cout << "[Test] Scenario B: unknown camera..." << std::endl;
    Fixture f("NIKON Z6");
    f.config.delete_after_verify = true;
    FakeProbe probe(true);
    RecordingNotifier notifier;
    Collaborators hooks;
    hooks.notifier = &notifier;
    Orchestrator orchestrator(f.config, f.profiles, f.reader, probe, hooks);
    RunReport report = orchestrator.run(f.card);

    expect(report.state == PipelineState::Failed, "run Failed");
    expect(report.failure_kind == ErrorKind::UnidentifiedCamera, "UnidentifiedCamera");
    expect(report.exit_code() == EXIT_UNIDENTIFIED, "non-zero exit code");
    expect(fs::is_empty(f.store) && !fs::exists(f.staging), "zero bytes copied");
    expect(card_intact(f), "card untouched");
    expect(notifier.kinds.size() == 1 && notifier.kinds[0] == ErrorKind::UnidentifiedCamera,
           "notifier told about the failure");
}

static void testCollision() {
    std::cout << "[Test] Scenario C: day-folder exists..." << std::endl;
    Fixture f;
    f.config.delete_after_verify = true;
    fs::create_directories(f.day(f.store));
    FakeProbe probe(true);
    Orchestrator orchestrator(f.config, f.profiles, f.reader, probe);
    RunReport report = orchestrator.run(f.card);

    expect(report.failure_kind == ErrorKind::CollisionError, "CollisionError");
    expect(report.exit_code() == EXIT_COLLISION, "collision exit code");
    expect(fs::is_empty(f.day(f.store)), "nothing merged into the existing folder");
    expect(!fs::exists(f.staging), "no fallback to staging on collision");
    expect(report.transitions.back().state == PipelineState::Failed &&
               report.transitions[report.transitions.size() - 2].state ==
                   PipelineState::CheckingCollision,
           "failed during CheckingCollision");
    expect(card_intact(f), "card untouched");
}

static void testStagingFallback() {
    std::cout << "[Test] Store down, staging used..." << std::endl;
    Fixture f;
    FakeProbe probe(false);
    Orchestrator orchestrator(f.config, f.profiles, f.reader, probe);
    RunReport report = orchestrator.run(f.card);

    expect(report.succeeded(), "run Done");
    expect(report.route && report.route->kind == DestinationKind::Staging, "staging route");
    expect(fs::exists(f.day(f.staging) / "DCIM/100MSDCF/DSC00002.ARW"), "files staged");
    expect(fs::is_empty(f.store), "store untouched");
}

static void testGateDeclines() {
    std::cout << "[Test] Confirmation declined..." << std::endl;
    Fixture f;
    f.config.delete_after_verify = true;
    FakeProbe probe(true);
    ScriptedGate gate(false);
    Collaborators hooks;
    hooks.gate = &gate;
    Orchestrator orchestrator(f.config, f.profiles, f.reader, probe, hooks);
    RunReport report = orchestrator.run(f.card);

    expect(gate.calls == 1, "gate consulted once");
    expect(gate.seen.profile == "Sony A7C" && gate.seen.file_count == 4 &&
               gate.seen.import_date == today_stamp() &&
               gate.seen.day_folder == fs::path("Sony A7C") / today_stamp(),
           "summary describes the run");
    expect(report.failure_kind == ErrorKind::Cancelled, "Cancelled");
    expect(!visited(report, PipelineState::Routing), "gate answered before Routing");
    expect(!fs::exists(f.day(f.store)), "no day-folder created");
    expect(card_intact(f), "card untouched");
}

static void testCancelledBeforeStart() {
    std::cout << "[Test] Cancellation at a stage boundary..." << std::endl;
    Fixture f;
    FakeProbe probe(true);
    CancellationToken token;
    token.cancel();
    Collaborators hooks;
    hooks.token = &token;
    Orchestrator orchestrator(f.config, f.profiles, f.reader, probe, hooks);
    RunReport report = orchestrator.run(f.card);

    expect(report.failure_kind == ErrorKind::Cancelled &&
               report.exit_code() == EXIT_CANCELLED,
           "Cancelled with its exit code");
    expect(fs::is_empty(f.store), "nothing copied");
}

static void testTransferRetriesExhausted() {
    std::cout << "[Test] Transfer failure retried then failed..." << std::endl;
    Fixture f;
    f.config.delete_after_verify = true;
    fs::path vanishing = f.card / "DCIM/100MSDCF/DSC00003.JPG";
    // The card loses a file after it was inventoried
    ScriptedGate gate(true, [vanishing]() { fs::remove(vanishing); });
    FakeProbe probe(true);
    Collaborators hooks;
    hooks.gate = &gate;
    Orchestrator orchestrator(f.config, f.profiles, f.reader, probe, hooks);
    RunReport report = orchestrator.run(f.card);

    expect(report.failure_kind == ErrorKind::TransferError, "TransferError");
    expect(report.transfer_attempts == f.config.transfer_retries + 1, "all retries used");
    expect(!report.verification, "verification never ran");
    expect(report.files_written == 2 && report.transfer.skipped == 2,
           "files landed before the failure are reported");
    expect(is_import_incomplete(f.day(f.store)), "day-folder left resumable");
    expect(read_file(f.card / "DCIM/100MSDCF/DSC00001.ARW") ==
                   f.original.at("DCIM/100MSDCF/DSC00001.ARW") &&
               read_file(f.card / "PRIVATE/M4ROOT/CLIP/C0001.MP4") ==
                   f.original.at("PRIVATE/M4ROOT/CLIP/C0001.MP4"),
           "remaining card files untouched");
}

static void testResumeAfterFailedTransfer() {
    std::cout << "[Test] Later run resumes a failed transfer..." << std::endl;
    Fixture f;
    f.config.transfer_retries = 0;
    fs::path vanishing = f.card / "DCIM/100MSDCF/DSC00003.JPG";
    ScriptedGate gate(true, [vanishing]() { fs::remove(vanishing); });
    FakeProbe probe(true);
    Collaborators hooks;
    hooks.gate = &gate;
    RunReport first = Orchestrator(f.config, f.profiles, f.reader, probe, hooks).run(f.card);
    expect(first.failure_kind == ErrorKind::TransferError, "first run fails in Transferring");
    expect(first.transfer.copied == 2, "two files landed before the failure");

    // The card is reinserted intact
    write_file(vanishing, f.original.at("DCIM/100MSDCF/DSC00003.JPG"));
    RunReport second = Orchestrator(f.config, f.profiles, f.reader, probe).run(f.card);
    expect(second.state == PipelineState::Done, "second run Done instead of CollisionError");
    expect(second.transfer.skipped == 2 && second.transfer.copied == 2,
           "only the missing files copied");
    expect(second.day_folder == f.day(f.store), "resumed in the same day-folder");
    expect(!is_import_incomplete(f.day(f.store)), "marker cleared after verification");

    RunReport third = Orchestrator(f.config, f.profiles, f.reader, probe).run(f.card);
    expect(third.failure_kind == ErrorKind::CollisionError, "finished import is a collision");
}

static void testResumeStaysOnStartedRoot() {
    std::cout << "[Test] Resume stays on the root it started on..." << std::endl;
    Fixture f;
    mark_import_incomplete(f.day(f.staging), "profile=Sony A7C");
    FakeProbe probe(true);
    RunReport report = Orchestrator(f.config, f.profiles, f.reader, probe).run(f.card);

    expect(report.succeeded(), "run Done");
    expect(report.route && report.route->kind == DestinationKind::Staging,
           "staged import finished on staging");
    expect(fs::is_empty(f.store), "store not started in parallel");
}

static void testCorruptedBeforeVerification() {
    std::cout << "[Test] Scenario D: destination truncated before Verifying..." << std::endl;
    Fixture f;
    f.config.delete_after_verify = true;
    fs::path victim = f.day(f.store) / "DCIM/100MSDCF/DSC00002.ARW";
    FakeProbe probe(true);
    Collaborators hooks;
    hooks.progress = [victim](const TransferProgress& p) {
        if (p.files_done == p.files_total)
            fs::resize_file(victim, fs::file_size(victim) / 2);
    };
    RunReport report = Orchestrator(f.config, f.profiles, f.reader, probe, hooks).run(f.card);

    expect(report.failure_kind == ErrorKind::VerificationError, "VerificationError");
    expect(report.exit_code() == EXIT_VERIFICATION, "verification exit code");
    bool size_mismatch = false;
    if (report.verification) {
        for (const auto& r : report.verification->results) {
            size_mismatch = size_mismatch || (r.relative == "DCIM/100MSDCF/DSC00002.ARW" &&
                                              r.outcome == Outcome::SizeMismatch);
        }
    }
    expect(size_mismatch, "SizeMismatch reported for the truncated file");
    expect(!visited(report, PipelineState::CleaningUp), "CleaningUp never entered");
    expect(card_intact(f), "card byte-identical");
    expect(is_import_incomplete(f.day(f.store)), "day-folder left resumable");
}

static void testCleanupFailureStillDone() {
    std::cout << "[Test] Cleanup failure ends Done with a warning..." << std::endl;
    Fixture f;
    f.config.delete_after_verify = true;
    // Neither audit location can take the record
    write_file(f.scratch.path() / "audit-file", "not a directory");
    f.config.audit_dir = f.scratch.path() / "audit-file";
    fs::path blocker = f.day(f.store) / AUDIT_FILE_NAME;
    FakeProbe probe(true);
    Collaborators hooks;
    hooks.progress = [blocker](const TransferProgress& p) {
        if (p.files_done == 1)
            write_file(blocker / "occupied", "x");
    };
    RunReport report = Orchestrator(f.config, f.profiles, f.reader, probe, hooks).run(f.card);

    expect(report.state == PipelineState::Done && report.exit_code() == EXIT_OK,
           "run Done with exit 0");
    bool warned = false;
    for (const auto& w : report.warnings) {
        warned = warned || w.rfind("CleanupError: ", 0) == 0;
    }
    expect(warned, "CleanupError warning recorded");
    expect(visited(report, PipelineState::CleaningUp), "CleaningUp entered");
    expect(report.deleted == 0 && !report.cleanup_performed, "nothing deleted");
    expect(card_intact(f), "card byte-identical");
}

static void testProgressThroughPipeline() {
    std::cout << "[Test] Progress reported during Transferring..." << std::endl;
    Fixture f;
    FakeProbe probe(true);
    std::vector<TransferProgress> seen;
    Collaborators hooks;
    hooks.progress = [&seen](const TransferProgress& p) { seen.push_back(p); };
    RunReport report = Orchestrator(f.config, f.profiles, f.reader, probe, hooks).run(f.card);

    expect(report.succeeded(), "run Done");
    expect(seen.size() == 4 && seen.back().files_done == 4 &&
               seen.back().bytes_done == seen.back().bytes_total,
           "one report per file, ending complete");
}

static void testCommandNotifier() {
    std::cout << "[Test] Notification command..." << std::endl;
    Fixture f;
    fs::path out = f.scratch.path() / "notified.txt";
    CommandNotifier notifier("printf '%s|%s|%s' \"$OFFLOAD_STATE\" \"$OFFLOAD_KIND\" "
                             "\"$OFFLOAD_PROFILE\" > " +
                             shell_quote(out.string()));
    FakeProbe probe(true);
    Collaborators hooks;
    hooks.notifier = &notifier;
    Orchestrator orchestrator(f.config, f.profiles, f.reader, probe, hooks);
    RunReport report = orchestrator.run(f.card);

    expect(report.succeeded(), "run Done");
    expect(read_file(out) == "Done||Sony A7C", "environment exported to the command");

    RunReport failed;
    failed.state = PipelineState::Failed;
    failed.failure_kind = ErrorKind::CollisionError;
    failed.message = "it's there";
    std::string cmd = notifier.build_command(failed);
    expect(cmd.find("OFFLOAD_KIND='CollisionError'") != std::string::npos &&
               cmd.find("'it'\\''s there'") != std::string::npos,
           "values shell-quoted");
}

int main() {
    std::cout << "[Test] Starting pipeline tests..." << std::endl;
    Logger::getInstance().init(false, fs::path());

    try {
        testFullRunWithCleanup();
        testRunKeepsSourceByDefault();
        testUnknownCamera();
        testCollision();
        testStagingFallback();
        testGateDeclines();
        testCancelledBeforeStart();
        testTransferRetriesExhausted();
        testResumeAfterFailedTransfer();
        testResumeStaysOnStartedRoot();
        testCorruptedBeforeVerification();
        testCleanupFailureStillDone();
        testProgressThroughPipeline();
        testCommandNotifier();
    } catch (const std::exception& e) {
        std::cout << "[FAIL] Unexpected exception: " << e.what() << std::endl;
        return 1;
    }

    return finish("PipelineTest");
}
