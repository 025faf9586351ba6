#include <cassert>
#include <exception>
#include <stdexcept>
#include <string>

#include <txodump/common.hpp>
#include <txodump/common_utxo.hpp>
#include <txodump/kth_block.hpp>
#include <txodump/log.hpp>

using namespace txodump;

namespace {

stream_logger log_sink;

// Bitcoin block 0, as stored in block-raw-0-9999.csv
constexpr char const* genesis_hex =
    "0100000000000000000000000000000000000000000000000000000000000000000000003ba3edfd7a7b12b2"
    "7ac72c3e67768f617fc81bc3888a51323a9fb8aa4b1e5e4a29ab5f49ffff001d1dac2b7c01010000000100"
    "00000000000000000000000000000000000000000000000000000000000000ffffffff4d04ffff001d0104"
    "455468652054696d65732030332f4a616e2f32303039204368616e63656c6c6f72206f6e206272696e6b20"
    "6f66207365636f6e64206261696c6f757420666f722062616e6b73ffffffff0100f2052a01000000434104"
    "678afdb0fe5548271967f1a67130b7105cd6a828e03909a67962e0ea1f61deb649f6bc3f4cef38c4f35504"
    "e51ec112de5c384df7ba0b8d578a4c702b6bf11d5fac00000000";

void test_genesis() {
    log_sink.info("Test 1: decoding the genesis block...\n");
    auto const raw = hex2vec(genesis_hex);
    assert(raw.size() == 285);

    auto const blk = decode_block(raw, 0);
    assert(blk.transactions.size() == 1);

    auto const& tx = blk.transactions[0];
    assert(tx.inputs.size() == 1);
    assert(tx.inputs[0].previous_output.is_null());
    assert(tx.outputs.size() == 1);
    assert(tx.outputs[0].value == 5000000000);
    assert(tx.total_output_value() == 5000000000);
    assert(tx.serialized_size == 204);

    assert(format_key(make_utxo_key(tx.hash, 0)) ==
           "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b:0");
    log_sink.info("✓ coinbase 4a5e1e4b...:0, 50 BTC\n");
}

void test_garbage() {
    log_sink.info("Test 2: bytes that are not a block...\n");
    bool thrown = false;
    try {
        decode_block(hex2vec("0100000000"), 7);
    } catch (std::runtime_error const& e) {
        thrown = true;
        assert(std::string(e.what()).find("block 7") != std::string::npos);
    }
    assert(thrown);
    log_sink.info("✓ rejected\n");
}

} // anonymous namespace

int main() {
    try {
        test_genesis();
        test_garbage();
    } catch (std::exception const& e) {
        fmt::print(stderr, "Test failed with exception: {}\n", e.what());
        return 1;
    }
    fmt::print("All kth_block tests passed! ✅\n");
    return 0;
}
