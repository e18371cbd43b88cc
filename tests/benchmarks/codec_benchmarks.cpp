#include <benchmark/benchmark.h>
#include "tether/crypto/base64.hpp"
#include "tether/crypto/random.hpp"
#include "tether/network/envelope.hpp"
#include "tether/network/protocol.hpp"
#include <random>

using namespace tether;
using namespace tether::network;

namespace {

std::vector<std::uint8_t> random_bytes(std::size_t size) {
    std::vector<std::uint8_t> data(size);
    std::mt19937 gen(42);
    std::uniform_int_distribution<int> dist(0, 255);
    for (auto& byte : data) {
        byte = static_cast<std::uint8_t>(dist(gen));
    }
    return data;
}

}

static void BM_Base64Encode(benchmark::State& state) {
    crypto::SecureRandom::initialize();
    auto data = random_bytes(state.range(0));
    
    for (auto _ : state) {
        auto encoded = crypto::Base64::encode(data);
        benchmark::DoNotOptimize(encoded);
    }
    
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Base64Encode)->Range(1024, 1024*1024);

static void BM_Base64Decode(benchmark::State& state) {
    crypto::SecureRandom::initialize();
    auto encoded = crypto::Base64::encode(random_bytes(state.range(0)));
    
    for (auto _ : state) {
        auto decoded = crypto::Base64::decode(encoded);
        benchmark::DoNotOptimize(decoded);
    }
    
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Base64Decode)->Range(1024, 1024*1024);

static void BM_ChunkEnvelopeEncode(benchmark::State& state) {
    crypto::SecureRandom::initialize();
    auto data = random_bytes(state.range(0));
    
    for (auto _ : state) {
        auto chunk = ChunkMessage::from_bytes("download_1700000000000_0123abcd", 42, data);
        auto frame = build_frame(encode_envelope(chunk));
        benchmark::DoNotOptimize(frame);
    }
    
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ChunkEnvelopeEncode)->Arg(4096)->Arg(65536)->Arg(1024*1024);

static void BM_ChunkEnvelopeDecode(benchmark::State& state) {
    crypto::SecureRandom::initialize();
    auto chunk = ChunkMessage::from_bytes("download_1700000000000_0123abcd", 42, random_bytes(state.range(0)));
    auto text = encode_envelope(chunk);
    
    for (auto _ : state) {
        auto envelope = decode_envelope(text);
        auto* decoded = std::get_if<ChunkMessage>(&envelope);
        auto payload = decoded->decode_payload();
        benchmark::DoNotOptimize(payload);
    }
    
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ChunkEnvelopeDecode)->Arg(4096)->Arg(65536)->Arg(1024*1024);

static void BM_ControlEnvelopeRoundTrip(benchmark::State& state) {
    Envelope envelope = CompleteMessage{"download_1700000000000_0123abcd", 160, 10485760, std::string("laptop")};
    
    for (auto _ : state) {
        auto decoded = decode_envelope(encode_envelope(envelope));
        benchmark::DoNotOptimize(decoded);
    }
    
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ControlEnvelopeRoundTrip);

static void BM_FrameHeaderParse(benchmark::State& state) {
    auto serialized = FrameHeader(65536).serialize();
    
    for (auto _ : state) {
        auto header = FrameHeader::deserialize(serialized);
        benchmark::DoNotOptimize(header.is_valid());
    }
    
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_FrameHeaderParse);
