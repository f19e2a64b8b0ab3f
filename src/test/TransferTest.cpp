#include <chrono>
#include <iostream>
#include <vector>
#include "../core/cancel.hpp"
#include "../core/digest.hpp"
#include "../core/errors.hpp"
#include "../core/executor.hpp"
#include "../core/inventory.hpp"
#include "../defs.hpp"
#include "test_support.hpp"

using namespace offload;
using namespace offload_test;

static bool has_part_files(const fs::path& root) {
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.path().string().find(PART_SUFFIX) != std::string::npos) {
            return true;
        }
    }
    return false;
}

static void testDigest() {
    std::cout << "[Test] SHA-256 digests..." << std::endl;
    ScratchDir scratch("offload-digest");
    write_file(scratch.path() / "abc.txt", "abc");
    write_file(scratch.path() / "empty.txt", "");

    expect(sha256_file(scratch.path() / "abc.txt") ==
               "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
           "known vector for \"abc\"");
    expect(sha256_file(scratch.path() / "empty.txt") ==
               "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
           "known vector for the empty file");

    bool threw = false;
    try {
        sha256_file(scratch.path() / "missing");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect(threw, "missing file throws");
}

static void testParallelRecords() {
    std::cout << "[Test] Parallel digest pool..." << std::endl;
    ScratchDir scratch("offload-digest");
    std::vector<MediaFile> files;
    for (int i = 0; i < 40; ++i) {
        std::string rel = "DCIM/100MSDCF/DSC" + std::to_string(10000 + i) + ".ARW";
        write_file(scratch.path() / rel, std::string(1000 + i * 37, static_cast<char>('a' + i % 26)));
        MediaFile f;
        f.relative = rel;
        f.absolute = scratch.path() / rel;
        f.size = 1000 + i * 37;
        files.push_back(f);
    }

    RecordMap single = compute_records(files, 1);
    RecordMap pooled = compute_records(files, 8);
    bool same = single.size() == 40 && pooled.size() == 40;
    for (const auto& [rel, rec] : single) {
        auto it = pooled.find(rel);
        same = same && it != pooled.end() && it->second.digest == rec.digest &&
               it->second.size == rec.size;
    }
    expect(same, "worker count does not change the records");

    files.push_back(MediaFile{"DCIM/gone.ARW", scratch.path() / "DCIM/gone.ARW", 1,
                              SourceKind::Photo});
    bool threw = false;
    try {
        compute_records(files, 4);
    } catch (const std::exception&) {
        threw = true;
    }
    expect(threw, "a worker failure surfaces after the pool stops");
}

static void testFreshTransfer() {
    std::cout << "[Test] Fresh transfer..." << std::endl;
    ScratchDir scratch("offload-transfer");
    fs::path card = scratch.path() / "card";
    make_sony_card(card, "ILCE-7C");
    auto profiles = test_profiles();
    auto files = scan_media(card, *profiles[0]);

    // Stale part file from an interrupted run
    fs::path day = scratch.path() / "Photos/Sony A7C/20240501";
    write_file(day / ("DCIM/100MSDCF/DSC00001.ARW" + std::string(PART_SUFFIX)), "junk");

    auto old_time = fs::last_write_time(card / "DCIM/100MSDCF/DSC00002.ARW") - std::chrono::hours(48);
    fs::last_write_time(card / "DCIM/100MSDCF/DSC00002.ARW", old_time);

    TransferStats stats = transfer_files(files, day);
    expect(stats.total == 4 && stats.copied == 4 && stats.skipped == 0, "all four files copied");
    expect(stats.bytes == total_bytes(files), "byte count matches inventory");
    expect(read_file(day / "PRIVATE/M4ROOT/CLIP/C0001.MP4") ==
               read_file(card / "PRIVATE/M4ROOT/CLIP/C0001.MP4"),
           "clip copied under its subtree path");
    expect(!has_part_files(day), "no part files left behind");
    expect(fs::last_write_time(day / "DCIM/100MSDCF/DSC00002.ARW") == old_time,
           "mtime carried over");
    expect(!fs::exists(day / "DCIM/100MSDCF/._DSC00001.ARW"), "AppleDouble not copied");
    expect(fs::exists(card / "DCIM/100MSDCF/DSC00001.ARW"), "source untouched");
}

static void testResume() {
    std::cout << "[Test] Resume copies only the delta..." << std::endl;
    ScratchDir scratch("offload-transfer");
    fs::path card = scratch.path() / "card";
    make_sony_card(card, "ILCE-7C");
    auto files = scan_media(card, *test_profiles()[0]);
    fs::path day = scratch.path() / "Photos/Sony A7C/20240501";

    transfer_files(files, day);

    // One file lost, one truncated, one silently corrupted at the same size
    fs::remove(day / "DCIM/100MSDCF/DSC00001.ARW");
    std::string partial = read_file(card / "DCIM/100MSDCF/DSC00002.ARW").substr(0, 100);
    write_file(day / "DCIM/100MSDCF/DSC00002.ARW", partial);
    std::string flipped = read_file(card / "DCIM/100MSDCF/DSC00003.JPG");
    flipped[flipped.size() / 2] ^= 0x01;
    write_file(day / "DCIM/100MSDCF/DSC00003.JPG", flipped);

    TransferStats stats = transfer_files(files, day);
    expect(stats.copied == 3 && stats.skipped == 1, "three recopied, one skipped");
    expect(read_file(day / "DCIM/100MSDCF/DSC00003.JPG") ==
               read_file(card / "DCIM/100MSDCF/DSC00003.JPG"),
           "same-size corruption repaired");

    TransferStats again = transfer_files(files, day);
    expect(again.copied == 0 && again.skipped == 4 && again.bytes == 0,
           "complete destination is a no-op");
}

static void testCancellation() {
    std::cout << "[Test] Cancellation between files..." << std::endl;
    ScratchDir scratch("offload-transfer");
    fs::path card = scratch.path() / "card";
    make_sony_card(card, "ILCE-7C");
    auto files = scan_media(card, *test_profiles()[0]);
    fs::path day = scratch.path() / "Photos/Sony A7C/20240501";

    CancellationToken token;
    token.cancel();
    bool cancelled = false;
    try {
        transfer_files(files, day, &token);
    } catch (const OffloadError& e) {
        cancelled = e.kind() == ErrorKind::Cancelled;
    }
    expect(cancelled, "Cancelled raised");
    expect(!fs::exists(day / "DCIM"), "nothing copied after cancel");
}

static void testUnreadableSource() {
    std::cout << "[Test] Missing source file..." << std::endl;
    ScratchDir scratch("offload-transfer");
    fs::path day = scratch.path() / "day";
    std::vector<MediaFile> files{
        MediaFile{"DCIM/X.ARW", scratch.path() / "nope/X.ARW", 10, SourceKind::Photo}};

    bool threw = false;
    try {
        transfer_files(files, day);
    } catch (const OffloadError& e) {
        threw = e.kind() == ErrorKind::TransferError && e.retryable();
    }
    expect(threw, "TransferError raised");
    expect(!has_part_files(day), "failed copy leaves no part file");
}

static void testProgressReported() {
    std::cout << "[Test] Progress after every file..." << std::endl;
    ScratchDir scratch("offload-transfer");
    fs::path card = scratch.path() / "card";
    make_sony_card(card, "ILCE-7C");
    auto files = scan_media(card, *test_profiles()[0]);
    fs::path day = scratch.path() / "Photos/Sony A7C/20240501";

    std::vector<TransferProgress> seen;
    TransferControl control;
    control.progress = [&seen](const TransferProgress& p) { seen.push_back(p); };
    TransferStats stats;
    transfer_files(files, day, control, stats);

    expect(seen.size() == 4, "one report per file");
    bool monotonic = true;
    for (size_t i = 0; i < seen.size(); ++i) {
        monotonic = monotonic && seen[i].files_done == i + 1 && seen[i].files_total == 4 &&
                    seen[i].current == files[i].relative;
    }
    expect(monotonic, "files counted in inventory order");
    expect(!seen.empty() && seen.back().bytes_done == total_bytes(files) &&
               seen.back().bytes_total == total_bytes(files),
           "byte totals reach the inventory size");
    expect(!seen.empty() && seen.back().bytes_per_second >= 0, "rate reported");

    seen.clear();
    transfer_files(files, day, control, stats);
    expect(seen.size() == 4 && seen.back().bytes_done == total_bytes(files),
           "skipped files still advance progress");
}

static void testStatsSurviveFailure() {
    std::cout << "[Test] Stats kept when an attempt fails..." << std::endl;
    ScratchDir scratch("offload-transfer");
    write_file(scratch.path() / "card/DCIM/A.ARW", "first file");
    std::vector<MediaFile> files{
        MediaFile{"DCIM/A.ARW", scratch.path() / "card/DCIM/A.ARW", 10, SourceKind::Photo},
        MediaFile{"DCIM/B.ARW", scratch.path() / "card/DCIM/B.ARW", 10, SourceKind::Photo}};

    TransferStats stats;
    bool threw = false;
    try {
        transfer_files(files, scratch.path() / "day", TransferControl(), stats);
    } catch (const OffloadError& e) {
        threw = e.kind() == ErrorKind::TransferError;
    }
    expect(threw, "second file fails");
    expect(stats.total == 2 && stats.copied == 1 && stats.bytes == 10,
           "first file still counted");
}

static void testImportMarker() {
    std::cout << "[Test] Incomplete-import marker..." << std::endl;
    ScratchDir scratch("offload-transfer");
    fs::path day = scratch.path() / "Photos/Sony A7C/20240501";

    expect(!is_import_incomplete(day), "no marker before the import");
    mark_import_incomplete(day, "profile=Sony A7C");
    expect(is_import_incomplete(day), "marker written");
    expect(read_file(day / INCOMPLETE_MARKER).find("Sony A7C") != std::string::npos,
           "marker names the import");
    expect(mark_import_complete(day) && !is_import_incomplete(day), "marker removed");
    expect(fs::is_directory(day), "day-folder kept");
}

int main() {
    std::cout << "[Test] Starting transfer tests..." << std::endl;
    Logger::getInstance().init(false, fs::path());

    try {
        testDigest();
        testParallelRecords();
        testFreshTransfer();
        testResume();
        testCancellation();
        testUnreadableSource();
        testProgressReported();
        testStatsSurviveFailure();
        testImportMarker();
    } catch (const std::exception& e) {
        std::cout << "[FAIL] Unexpected exception: " << e.what() << std::endl;
        return 1;
    }

    return finish("TransferTest");
}
