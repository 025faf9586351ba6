#include <cassert>
#include <exception>
#include <stdexcept>
#include <string>

#include <txodump/log.hpp>
#include <txodump/txo_writer.hpp>

#include "test_common.hpp"

using namespace txodump;
using namespace txodump::test;

namespace {

stream_logger log_sink;

void test_line_format_and_finalize() {
    log_sink.info("Test 1: line format and finalize...\n");
    auto const dir = make_temp_dir("writer_format");

    txo_writer writer(dir);
    assert(fs::exists(dir / "txo.csv.tmp"));
    assert( ! fs::exists(dir / "txo.csv"));

    writer.write({1, 1, 0, 5000});
    writer.write({700000, 123456, 42, 2100000000000000});
    assert(writer.lines_written() == 2);

    writer.finalize();
    assert(writer.finalized());
    assert( ! fs::exists(dir / "txo.csv.tmp"));
    assert(fs::exists(dir / "txo.csv"));

    auto const content = read_file(dir / "txo.csv");
    assert(content == "1;1;0;5000\n700000;123456;42;2100000000000000\n");
    assert(writer.bytes_written() == content.size());
    log_sink.info("✓ height;coin_age;fee_rate;value, no header\n");
}

void test_empty_finalize() {
    log_sink.info("Test 2: finalize with no records...\n");
    auto const dir = make_temp_dir("writer_empty");
    txo_writer writer(dir);
    writer.finalize();
    assert(fs::exists(dir / "txo.csv"));
    assert(fs::file_size(dir / "txo.csv") == 0);
    log_sink.info("✓ empty final file\n");
}

void test_interrupted_run_leaves_tmp_only() {
    log_sink.info("Test 3: writer destroyed before finalize...\n");
    auto const dir = make_temp_dir("writer_interrupted");
    {
        txo_writer writer(dir);
        writer.write({5, 2, 1, 10});
    }
    assert( ! fs::exists(dir / "txo.csv"));
    assert(fs::exists(dir / "txo.csv.tmp"));
    assert(read_file(dir / "txo.csv.tmp") == "5;2;1;10\n");
    log_sink.info("✓ only the working file remains\n");
}

void test_small_flush_threshold() {
    log_sink.info("Test 4: buffer flushes...\n");
    auto const dir = make_temp_dir("writer_flush");
    txo_writer writer(dir, 16);
    for (uint32_t i = 0; i < 1000; ++i) {
        writer.write({i, 0, 0, i});
    }
    // flushed well before finalize
    assert(fs::file_size(dir / "txo.csv.tmp") > 0);
    writer.finalize();

    auto const lines = read_lines(dir / "txo.csv");
    assert(lines.size() == 1000);
    assert(lines.front() == "0;0;0;0");
    assert(lines.back() == "999;0;0;999");
    log_sink.info("✓ records keep their order across flushes\n");
}

void test_truncates_previous_tmp() {
    log_sink.info("Test 5: stale working file is truncated...\n");
    auto const dir = make_temp_dir("writer_truncate");
    {
        std::ofstream stale(dir / "txo.csv.tmp");
        stale << "garbage\n";
    }
    txo_writer writer(dir);
    writer.write({3, 1, 0, 1});
    writer.finalize();
    assert(read_file(dir / "txo.csv") == "3;1;0;1\n");
    log_sink.info("✓ truncated\n");
}

void test_bad_folder() {
    log_sink.info("Test 6: missing folder...\n");
    auto const dir = make_temp_dir("writer_bad") / "does_not_exist";
    bool thrown = false;
    try {
        txo_writer writer(dir);
    } catch (std::runtime_error const& e) {
        thrown = true;
        assert(std::string(e.what()).find("does_not_exist") != std::string::npos);
    }
    assert(thrown);
    log_sink.info("✓ setup error names the folder\n");
}

void test_write_after_finalize() {
    log_sink.info("Test 7: write after finalize...\n");
    auto const dir = make_temp_dir("writer_after");
    txo_writer writer(dir);
    writer.finalize();

    bool thrown = false;
    try {
        writer.write({1, 0, 0, 1});
    } catch (std::logic_error const&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        writer.finalize();
    } catch (std::logic_error const&) {
        thrown = true;
    }
    assert(thrown);
    log_sink.info("✓ rejected\n");
}

void test_interrupted_run_removes_previous_final() {
    log_sink.info("Test 8: interrupted run after a completed one...\n");
    auto const dir = make_temp_dir("writer_rerun");
    {
        txo_writer first(dir);
        first.write({1, 1, 0, 100});
        first.finalize();
    }
    assert(fs::exists(dir / "txo.csv"));
    {
        txo_writer second(dir);
        assert( ! fs::exists(dir / "txo.csv"));
        second.write({2, 1, 0, 200});
    }
    assert( ! fs::exists(dir / "txo.csv"));
    assert(read_file(dir / "txo.csv.tmp") == "2;1;0;200\n");
    log_sink.info("✓ no final file from the earlier run\n");
}

void test_rename_failure() {
    log_sink.info("Test 9: final name taken by a directory...\n");
    auto const dir = make_temp_dir("writer_rename");
    txo_writer writer(dir);
    writer.write({4, 2, 1, 50});

    fs::create_directories(dir / "txo.csv" / "sub");

    std::string msg;
    try {
        writer.finalize();
    } catch (std::runtime_error const& e) {
        msg = e.what();
    }
    assert( ! msg.empty());
    assert(msg.find("txo.csv.tmp") != std::string::npos);
    assert( ! writer.finalized());
    assert(fs::exists(dir / "txo.csv.tmp"));
    assert(read_file(dir / "txo.csv.tmp") == "4;2;1;50\n");
    assert(fs::is_directory(dir / "txo.csv"));
    log_sink.info("✓ rename error reported, working file kept\n");
}

void test_write_failure_keeps_buffer() {
    log_sink.info("Test 10: write to a full device...\n");
    if ( ! fs::exists("/dev/full")) {
        log_sink.info("/dev/full not available, skipped\n");
        return;
    }
    auto const dir = make_temp_dir("writer_full");
    fs::create_symlink("/dev/full", dir / "txo.csv.tmp");

    txo_writer writer(dir, 16);
    bool thrown = false;
    try {
        for (uint32_t i = 0; i < 100; ++i) {
            writer.write({i, 0, 0, i});
        }
    } catch (std::runtime_error const&) {
        thrown = true;
    }
    assert(thrown);
    assert(writer.lines_written() > 0);

    thrown = false;
    try {
        writer.finalize();
    } catch (std::runtime_error const&) {
        thrown = true;
    }
    assert(thrown);
    assert( ! writer.finalized());
    assert( ! fs::exists(dir / "txo.csv"));
    log_sink.info("✓ failure reported on flush and finalize\n");
}

} // anonymous namespace

int main() {
    try {
        test_line_format_and_finalize();
        test_empty_finalize();
        test_interrupted_run_leaves_tmp_only();
        test_small_flush_threshold();
        test_truncates_previous_tmp();
        test_bad_folder();
        test_write_after_finalize();
        test_interrupted_run_removes_previous_final();
        test_rename_failure();
        test_write_failure_keeps_buffer();
    } catch (std::exception const& e) {
        fmt::print(stderr, "Test failed with exception: {}\n", e.what());
        return 1;
    }
    fmt::print("All txo_writer tests passed! ✅\n");
    return 0;
}
