#include <fmt/core.h>
#include <sodium/core.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "../src/HelperSources/Helper.hpp"
#include "../src/HelperSources/TimeHelper.hpp"
#include "../src/fountain/ChunkSelector.h"
#include "../src/fountain/DegreeSampler.h"
#include "../src/fountain/Droplet.h"
#include "../src/fountain/FileFraming.h"
#include "../src/fountain/FountainEncoder.h"
#include "../src/fountain/GlassDecoder.h"
#include "../src/qrfountain_spdlog.h"

// Unit tests for the fountain code itself, no session / threading involved

using namespace qrfountain;

namespace TestSampler {

static void test_distribution(const uint32_t K) {
  DegreeSampler sampler{K};
  const auto& cdf = sampler.cdf();
  assert(!cdf.empty());
  assert(sampler.max_degree() >= 1 && sampler.max_degree() <= K);
  for (std::size_t i = 1; i < cdf.size(); i++) {
    assert(cdf[i] >= cdf[i - 1]);
  }
  assert(cdf.back() == 1.0);
  double sum = 0;
  for (uint32_t d = 1; d <= sampler.max_degree(); d++) {
    assert(sampler.probability(d) >= 0);
    sum += sampler.probability(d);
  }
  assert(std::abs(sum - 1.0) < 1e-9);
  assert(sampler.probability(0) == 0);
  assert(sampler.probability(sampler.max_degree() + 1) == 0);
  SeededRandom rng{K};
  for (int i = 0; i < 10000; i++) {
    const auto d = sampler.sample(rng);
    assert(d >= 1 && d <= sampler.max_degree());
  }
  assert(sampler.degree_for_unit(0.0) == 1);
  assert(sampler.degree_for_unit(0.9999999999) <= sampler.max_degree());
}

static void test_degree_sampler() {
  fmt::print("test_degree_sampler begin\n");
  for (const uint32_t K : {1u, 2u, 3u, 10u, 100u, 1000u, 10000u}) {
    test_distribution(K);
  }
  // K==1 only knows degree 1
  {
    DegreeSampler sampler{1};
    assert(sampler.max_degree() == 1);
    SeededRandom rng{0};
    for (int i = 0; i < 100; i++) {
      assert(sampler.sample(rng) == 1);
    }
  }
  // low degrees dominate, like the soliton distribution should
  {
    DegreeSampler sampler{1000};
    assert(sampler.probability(2) > sampler.probability(10));
    assert(sampler.cdf()[9] > 0.5);
  }
  bool thrown = false;
  try {
    DegreeSampler sampler{0};
  } catch (const std::invalid_argument&) {
    thrown = true;
  }
  assert(thrown);
  thrown = false;
  try {
    DegreeSampler sampler{10, SolitonParams{0.05, 1.5}};
  } catch (const std::invalid_argument&) {
    thrown = true;
  }
  assert(thrown);
  fmt::print("test_degree_sampler end\n");
}

static void test_seeded_random() {
  SeededRandom rng1{42};
  SeededRandom rng2{42};
  for (int i = 0; i < 1000; i++) {
    assert(rng1.next_u32() == rng2.next_u32());
  }
  rng1.reseed(7);
  rng2.reseed(7);
  for (int i = 0; i < 1000; i++) {
    const auto below = rng1.next_below(13);
    assert(below < 13);
    assert(below == rng2.next_below(13));
    const auto unit = rng1.next_unit();
    assert(unit >= 0.0 && unit < 1.0);
    assert(unit == rng2.next_unit());
  }
}

static void test_chunk_selector() {
  fmt::print("test_chunk_selector begin\n");
  for (uint32_t seed = 0; seed < 200; seed++) {
    for (const uint32_t K : {1u, 2u, 7u, 100u}) {
      for (const uint32_t degree : {0u, 1u, 2u, 5u, 150u}) {
        const auto indices = ChunkSelector::select(seed, degree, K);
        assert(indices == ChunkSelector::select(seed, degree, K));
        assert(indices.size() == std::min(degree, K));
        const std::set<uint32_t> as_set(indices.begin(), indices.end());
        assert(as_set.size() == indices.size());
        for (std::size_t i = 0; i < indices.size(); i++) {
          assert(indices[i] < K);
          if (i > 0) assert(indices[i - 1] < indices[i]);
        }
      }
    }
  }
  // degree >= K selects everything
  assert(ChunkSelector::select(5, 4, 4) ==
         std::vector<uint32_t>({0, 1, 2, 3}));
  assert(ChunkSelector::select(5, 40, 4) ==
         std::vector<uint32_t>({0, 1, 2, 3}));
  // different seeds give different selections (not for all, but for most)
  int n_different = 0;
  for (uint32_t seed = 1; seed < 100; seed++) {
    if (ChunkSelector::select(seed, 3, 1000) !=
        ChunkSelector::select(seed + 1, 3, 1000)) {
      n_different++;
    }
  }
  assert(n_different > 90);
  fmt::print("select(1,3,1000): {}\n",
             StringHelper::vectorAsString(ChunkSelector::select(1, 3, 1000)));
  DropletScheme scheme{50, SolitonParams{}};
  for (uint32_t seed = 0; seed < 100; seed++) {
    assert(scheme.indices_for_seed(seed).size() ==
           scheme.degree_for_seed(seed));
  }
  fmt::print("test_chunk_selector end\n");
}

}  // namespace TestSampler

namespace TestWire {

static void assert_parse_error(const std::string& wire, ParseError expected) {
  const auto res = droplet_from_wire(wire);
  if (res.error != expected) {
    fmt::print("Unexpected result for [{}] got {} expected {}\n", wire,
               parse_error_as_string(res.error),
               parse_error_as_string(expected));
  }
  assert(!res.ok());
  assert(res.error == expected);
}

static void test_wire_codec() {
  fmt::print("test_wire_codec begin\n");
  Droplet droplet;
  droplet.seed = 123456;
  droplet.num_chunks = 17;
  droplet.padding = 3;
  droplet.payload = GenericHelper::createRandomDataBuffer(200, 1);
  const auto wire = droplet_to_wire(droplet);
  assert(wire.rfind("123456|17|3|", 0) == 0);
  const auto parsed = droplet_from_wire(wire);
  assert(parsed.ok());
  assert(parsed.error == ParseError::NONE);
  assert(parsed.droplet.value() == droplet);
  // 3 zero bytes
  {
    const auto res = droplet_from_wire("1|1|0|AAAA");
    assert(res.ok());
    assert(res.droplet->payload == std::vector<uint8_t>(3, 0));
    assert(res.droplet->chunk_size() == 3);
  }
  // max seed that is still a data droplet
  assert(droplet_from_wire("4294967294|1|0|AAAA").ok());

  assert_parse_error("", ParseError::WRONG_FIELD_COUNT);
  assert_parse_error("1|2|3", ParseError::WRONG_FIELD_COUNT);
  assert_parse_error("1|1|0|AAAA|AAAA", ParseError::WRONG_FIELD_COUNT);
  assert_parse_error("hello world", ParseError::WRONG_FIELD_COUNT);
  assert_parse_error("a|1|0|AAAA", ParseError::BAD_NUMBER);
  assert_parse_error("|1|0|AAAA", ParseError::BAD_NUMBER);
  assert_parse_error("1||0|AAAA", ParseError::BAD_NUMBER);
  assert_parse_error("1|1||AAAA", ParseError::BAD_NUMBER);
  assert_parse_error("-1|1|0|AAAA", ParseError::BAD_NUMBER);
  assert_parse_error(" 1|1|0|AAAA", ParseError::BAD_NUMBER);
  assert_parse_error("4294967296|1|0|AAAA", ParseError::BAD_NUMBER);
  assert_parse_error("99999999999|1|0|AAAA", ParseError::BAD_NUMBER);
  assert_parse_error("1|1|0|", ParseError::BAD_PAYLOAD);
  assert_parse_error("1|1|0|!!!!", ParseError::BAD_PAYLOAD);
  assert_parse_error("1|0|0|AAAA", ParseError::BAD_PARAMETERS);
  assert_parse_error("1|1000001|0|AAAA", ParseError::BAD_PARAMETERS);
  // padding must be smaller than the chunk
  assert_parse_error("1|1|3|AAAA", ParseError::BAD_PARAMETERS);
  // K * chunk size above MAX_TRANSFER_SIZE
  assert_parse_error("7|1000000|0|" + std::string(2728, 'A'),
                     ParseError::BAD_PARAMETERS);
  assert(droplet_from_wire("7|1000000|0|AAAA").ok());
  // the manifest is exempt, its K is no chunk count
  assert(droplet_from_wire("4294967295|1000000|0|" + std::string(2728, 'A'))
             .ok());
  fmt::print("test_wire_codec end\n");
}

static void test_manifest() {
  const auto manifest = make_manifest_droplet(3);
  assert(manifest.is_manifest());
  assert(manifest_file_count(manifest) == 3u);
  const auto parsed = droplet_from_wire(droplet_to_wire(manifest));
  assert(parsed.ok());
  assert(parsed.droplet->is_manifest());
  assert(manifest_file_count(parsed.droplet.value()) == 3u);
  // data droplets are no manifests
  Droplet data{1, 1, 0, {'3'}};
  assert(!manifest_file_count(data).has_value());
  const std::string padded("12\n\0\0", 5);
  assert(parse_file_count(reinterpret_cast<const uint8_t*>(padded.data()),
                          padded.size()) == 12u);
  const std::string garbage = "12a";
  assert(!parse_file_count(reinterpret_cast<const uint8_t*>(garbage.data()),
                           garbage.size())
              .has_value());
}

static void test_file_framing() {
  fmt::print("test_file_framing begin\n");
  const auto body = GenericHelper::createRandomDataBuffer(100, 2);
  {
    const auto framed = build_framed_payload("photo.jpg", 2, 5, body);
    const auto header = parse_file_header(framed.data(), framed.size());
    assert(header.has_value());
    assert(header->name == "photo.jpg");
    assert(header->index == 2u);
    assert(header->total == 5u);
    const std::string digest = compute_file_digest(body);
    assert(digest.size() == FILE_DIGEST_HEX_LEN);
    assert(header->digest == digest);
    assert(header->header_size ==
           std::string("photo.jpg|2|5|" + digest + "\n").size());
    assert(std::vector<uint8_t>(framed.begin() + header->header_size,
                                framed.end()) == body);
    const uint8_t* framed_body = framed.data() + header->header_size;
    assert(verify_file_digest(header.value(), framed_body, body.size()));
    auto other_body = body;
    other_body[50] ^= 1;
    assert(!verify_file_digest(header.value(), other_body.data(),
                               other_body.size()));
    assert(!verify_file_digest(header.value(), framed_body, body.size() - 1));
  }
  {
    // written by transmitters without the digest
    const std::string framed = "photo.jpg|2|5\nxyz";
    const auto header = parse_file_header(
        reinterpret_cast<const uint8_t*>(framed.data()), framed.size());
    assert(header.has_value());
    assert(header->name == "photo.jpg");
    assert(header->index == 2u);
    assert(header->total == 5u);
    assert(!header->digest.has_value());
    assert(header->header_size == std::string("photo.jpg|2|5\n").size());
    // nothing to check against
    assert(verify_file_digest(header.value(), nullptr, 0));
  }
  {
    const auto framed = build_framed_payload("notes.txt", body);
    const auto header = parse_file_header(framed.data(), framed.size());
    assert(header.has_value());
    assert(header->name == "notes.txt");
    assert(!header->index.has_value());
    assert(!header->total.has_value());
  }
  {
    // the name itself may contain the delimiter
    const auto framed = build_framed_payload("a|b", 1, 1, body);
    const auto header = parse_file_header(framed.data(), framed.size());
    assert(header->name == "a|b");
    assert(header->index == 1u);
    assert(header->digest.has_value());
  }
  {
    // a trailing hex string without index and total belongs to the name
    const std::string framed =
        "notes|0123456789abcdef0123456789abcdef\nxyz";
    const auto header = parse_file_header(
        reinterpret_cast<const uint8_t*>(framed.data()), framed.size());
    assert(header->name == "notes|0123456789abcdef0123456789abcdef");
    assert(!header->index.has_value());
    assert(!header->digest.has_value());
  }
  {
    // only a prefix without the newline yet
    const std::string partial = "some_name_that_is_lo";
    assert(!parse_file_header(reinterpret_cast<const uint8_t*>(partial.data()),
                              partial.size())
                .has_value());
  }
  assert(sanitize_file_name("../../etc/passwd", "x") == "passwd");
  assert(sanitize_file_name("C:\\tmp\\a.txt", "x") == "a.txt");
  assert(sanitize_file_name("dir/", "x") == "x");
  assert(sanitize_file_name("..", "x") == "x");
  assert(sanitize_file_name("", "x") == "x");
  fmt::print("test_file_framing end\n");
}

}  // namespace TestWire

namespace TestFountain {

static FountainEncoder::Options make_options(uint32_t chunk_size,
                                             uint32_t start_seed) {
  FountainEncoder::Options options{};
  options.chunk_size = chunk_size;
  options.start_seed = start_seed;
  return options;
}

static void test_encoder() {
  fmt::print("test_encoder begin\n");
  bool thrown = false;
  try {
    FountainEncoder encoder{{}, make_options(200, 1)};
  } catch (const std::invalid_argument&) {
    thrown = true;
  }
  assert(thrown);
  thrown = false;
  try {
    FountainEncoder encoder{{1, 2, 3}, make_options(0, 1)};
  } catch (const std::invalid_argument&) {
    thrown = true;
  }
  assert(thrown);
  {
    FountainEncoder encoder{GenericHelper::createRandomDataBuffer(1000, 3),
                            make_options(200, 1)};
    assert(encoder.num_chunks() == 5);
    assert(encoder.padding() == 0);
  }
  const auto data = GenericHelper::createRandomDataBuffer(1001, 4);
  FountainEncoder encoder{data, make_options(200, 1)};
  assert(encoder.num_chunks() == 6);
  assert(encoder.padding() == 199);
  // last chunk is zero padded
  assert(encoder.chunk_data(5)[0] == data[1000]);
  for (int i = 1; i < 200; i++) {
    assert(encoder.chunk_data(5)[i] == 0);
  }
  std::vector<Droplet> first;
  for (int i = 0; i < 20; i++) {
    const auto droplet = encoder.next_droplet();
    assert(!droplet.is_manifest());
    assert(droplet.num_chunks == 6);
    assert(droplet.padding == 199);
    assert(droplet.chunk_size() == 200);
    // deterministic per seed
    assert(encoder.droplet_for_seed(droplet.seed) == droplet);
    first.push_back(droplet);
  }
  assert(encoder.get_latest_stats().n_droplets == 20);
  encoder.reset();
  for (int i = 0; i < 20; i++) {
    assert(encoder.next_droplet() == first[i]);
  }
  // a second encoder for the same data produces the same stream
  FountainEncoder encoder2{data, make_options(200, 1)};
  assert(encoder2.next_droplet() == first[0]);
  // the tag ends up in the top bits of every seed
  for (const uint8_t tag : {uint8_t{0}, uint8_t{5}, uint8_t{0xFF}}) {
    auto tag_options = make_options(200, 1);
    tag_options.transfer_tag = tag;
    FountainEncoder tagged{data, tag_options};
    for (int i = 0; i < 1000; i++) {
      const auto droplet = tagged.next_droplet();
      assert(!droplet.is_manifest());
      assert(droplet.transfer_tag() == tag);
    }
  }
  // K * chunk size above MAX_TRANSFER_SIZE
  thrown = false;
  try {
    FountainEncoder encoder3{{1, 2, 3}, make_options(0xFFFFFFFF, 1)};
  } catch (const std::invalid_argument&) {
    thrown = true;
  }
  assert(thrown);
  fmt::print("test_encoder end\n");
}

// Feeds droplets until complete, returns the n of droplets needed
static int feed_until_complete(FountainEncoder& encoder, GlassDecoder& decoder,
                               const int max_droplets) {
  for (int i = 1; i <= max_droplets; i++) {
    const auto status = decoder.ingest(encoder.next_droplet());
    assert(status != IngestStatus::INCONSISTENT_PARAMETERS);
    if (decoder.is_complete()) {
      return i;
    }
  }
  return -1;
}

static void test_round_trip() {
  fmt::print("test_round_trip begin\n");
  const uint32_t chunk_size = 200;
  for (const std::size_t size :
       {std::size_t(1), std::size_t(199), std::size_t(200), std::size_t(201),
        std::size_t(1000), std::size_t(4567), std::size_t(20000)}) {
    for (const uint32_t start_seed : {1337u, 4242u, 7u}) {
      const auto data = GenericHelper::createRandomDataBuffer(size, start_seed);
      FountainEncoder encoder{data, make_options(chunk_size, start_seed)};
      GlassDecoder decoder{};
      const int max_droplets = 20 * static_cast<int>(encoder.num_chunks()) + 100;
      const auto before = std::chrono::steady_clock::now();
      const int needed = feed_until_complete(encoder, decoder, max_droplets);
      assert(needed > 0);
      assert(needed >= static_cast<int>(encoder.num_chunks()));
      const auto out = decoder.reconstruct();
      GenericHelper::assertVectorsEqual(data, out);
      assert(decoder.padding() == encoder.padding());
      log::get_default()->debug("size:{} K:{} needed {} droplets, took {}",
                                size, encoder.num_chunks(), needed,
                                MyTimeHelper::R(std::chrono::steady_clock::now() -
                                                before));
    }
  }
  fmt::print("test_round_trip end\n");
}

// K==1 (data fits into a single chunk) and P==0 (data fills all chunks)
static void test_boundaries() {
  {
    const auto data = GenericHelper::createRandomDataBuffer(50, 5);
    FountainEncoder encoder{data, make_options(200, 1)};
    assert(encoder.num_chunks() == 1);
    assert(encoder.padding() == 150);
    GlassDecoder decoder{};
    assert(decoder.ingest(encoder.next_droplet()) == IngestStatus::RESOLVED);
    assert(decoder.is_complete());
    assert(decoder.reconstruct() == data);
  }
  {
    const auto data = GenericHelper::createRandomDataBuffer(200, 6);
    FountainEncoder encoder{data, make_options(200, 1)};
    assert(encoder.num_chunks() == 1);
    assert(encoder.padding() == 0);
    GlassDecoder decoder{};
    assert(decoder.ingest(encoder.next_droplet()) == IngestStatus::RESOLVED);
    assert(decoder.reconstruct() == data);
  }
  {
    const auto data = GenericHelper::createRandomDataBuffer(3000, 7);
    FountainEncoder encoder{data, make_options(300, 1337)};
    assert(encoder.num_chunks() == 10);
    assert(encoder.padding() == 0);
    GlassDecoder decoder{};
    assert(feed_until_complete(encoder, decoder, 1000) > 0);
    assert(decoder.reconstruct() == data);
  }
}

// Reverse order, with fixed degrees. After all 8 droplets are in, all 5
// chunks are known.
static void test_fixed_degree_scenario() {
  fmt::print("test_fixed_degree_scenario begin\n");
  const std::vector<uint32_t> degrees = {1, 2, 1, 3, 2, 1, 4, 2};
  const auto degree_for_seed = [degrees](uint32_t seed) {
    assert(seed >= 1 && seed <= degrees.size());
    return degrees[seed - 1];
  };
  auto scheme = std::make_shared<const DropletScheme>(5, degree_for_seed);
  const auto data = GenericHelper::createRandomDataBuffer(1000, 8);
  FountainEncoder::Options options = make_options(200, 1);
  options.opt_scheme = scheme;
  uint32_t next_seed = 1;
  options.opt_seed_source = [&next_seed]() { return next_seed++; };
  FountainEncoder encoder{data, options};
  assert(encoder.num_chunks() == 5);
  assert(encoder.padding() == 0);
  std::vector<Droplet> droplets;
  for (int i = 0; i < 8; i++) {
    droplets.push_back(encoder.next_droplet());
    assert(droplets.back().seed == static_cast<uint32_t>(i + 1));
    assert(scheme->indices_for_seed(i + 1).size() == degrees[i]);
  }
  GlassDecoder decoder{[scheme](uint32_t num_chunks) {
    assert(num_chunks == 5);
    return scheme;
  }};
  std::vector<IngestStatus> statuses;
  uint32_t last_resolved = 0;
  for (auto it = droplets.rbegin(); it != droplets.rend(); ++it) {
    statuses.push_back(decoder.ingest(*it));
    assert(decoder.resolved_count() >= last_resolved);
    last_resolved = decoder.resolved_count();
  }
  const std::vector<IngestStatus> expected = {
      IngestStatus::PENDING,  IngestStatus::PENDING,  IngestStatus::RESOLVED,
      IngestStatus::PENDING,  IngestStatus::PENDING,  IngestStatus::RESOLVED,
      IngestStatus::REDUNDANT, IngestStatus::REDUNDANT};
  assert(statuses == expected);
  assert(decoder.is_complete());
  assert(decoder.reconstruct() == data);
  assert(decoder.get_latest_stats().n_chunks_resolved_by_peeling == 3);
  assert(decoder.pending_count() == 0);
  fmt::print("test_fixed_degree_scenario end\n");
}

// Each droplet carries exactly one chunk, complete once every chunk was seen
static void test_degree_one() {
  const uint32_t K = 10;
  auto scheme = std::make_shared<const DropletScheme>(
      K, [](uint32_t) { return 1u; });
  const auto data = GenericHelper::createRandomDataBuffer(K * 100, 9);
  FountainEncoder::Options options = make_options(100, 99);
  options.opt_scheme = scheme;
  FountainEncoder encoder{data, options};
  GlassDecoder decoder{[scheme](uint32_t) { return scheme; }};
  std::set<uint32_t> seen;
  for (int i = 0; i < 2000 && !decoder.is_complete(); i++) {
    const auto droplet = encoder.next_droplet();
    const auto index = scheme->indices_for_seed(droplet.seed).at(0);
    const bool is_new = seen.insert(index).second;
    const auto status = decoder.ingest(droplet);
    assert(status ==
           (is_new ? IngestStatus::RESOLVED : IngestStatus::REDUNDANT));
    assert(decoder.is_chunk_resolved(index));
    assert(decoder.get_chunk(index).value() ==
           std::vector<uint8_t>(encoder.chunk_data(index),
                                encoder.chunk_data(index) + 100));
  }
  assert(decoder.is_complete());
  assert(seen.size() == K);
  assert(decoder.reconstruct() == data);
}

// resolved_count never decreases, complete stays complete, and feeding the
// same droplets again changes nothing
static void test_monotonic_and_idempotent() {
  fmt::print("test_monotonic_and_idempotent begin\n");
  const auto data = GenericHelper::createRandomDataBuffer(2000, 10);
  FountainEncoder encoder{data, make_options(200, 1337)};
  std::vector<Droplet> droplets;
  for (uint32_t i = 0; i < 4 * encoder.num_chunks(); i++) {
    droplets.push_back(encoder.next_droplet());
  }
  GenericHelper::shuffle(droplets, 11);
  GlassDecoder decoder{};
  GlassDecoder decoder_twice{};
  uint32_t last_resolved = 0;
  bool was_complete = false;
  for (const auto& droplet : droplets) {
    decoder.ingest(droplet);
    assert(decoder.resolved_count() >= last_resolved);
    last_resolved = decoder.resolved_count();
    if (was_complete) assert(decoder.is_complete());
    was_complete = decoder.is_complete();

    decoder_twice.ingest(droplet);
    const auto resolved_before = decoder_twice.resolved_count();
    assert(decoder_twice.ingest(droplet) == IngestStatus::REDUNDANT);
    assert(decoder_twice.resolved_count() == resolved_before);
    assert(decoder_twice.resolved_count() == decoder.resolved_count());
  }
  assert(decoder.is_complete());
  assert(decoder_twice.is_complete());
  assert(decoder.reconstruct() == data);
  assert(decoder_twice.reconstruct() == data);
  fmt::print("test_monotonic_and_idempotent end\n");
}

static void test_decoder_rejects() {
  GlassDecoder decoder{};
  bool thrown = false;
  try {
    decoder.reconstruct();
  } catch (const ReconstructBeforeComplete& e) {
    thrown = true;
  }
  assert(thrown);
  assert(decoder.ingest(make_manifest_droplet(2)) ==
         IngestStatus::NOT_A_DATA_DROPLET);
  assert(!decoder.has_parameters());
  const auto data = GenericHelper::createRandomDataBuffer(1000, 12);
  FountainEncoder encoder{data, make_options(100, 5)};
  assert(decoder.ingest(encoder.next_droplet()) !=
         IngestStatus::INCONSISTENT_PARAMETERS);
  assert(decoder.has_parameters());
  assert(decoder.num_chunks() == 10);
  auto other_k = encoder.next_droplet();
  other_k.num_chunks = 11;
  assert(decoder.ingest(other_k) == IngestStatus::INCONSISTENT_PARAMETERS);
  auto other_padding = encoder.next_droplet();
  other_padding.padding = 1;
  assert(decoder.ingest(other_padding) ==
         IngestStatus::INCONSISTENT_PARAMETERS);
  auto other_size = encoder.next_droplet();
  other_size.payload.push_back(0);
  assert(decoder.ingest(other_size) == IngestStatus::INCONSISTENT_PARAMETERS);
  assert(decoder.get_latest_stats().n_rejected == 4);
  if (!decoder.is_complete()) {
    thrown = false;
    try {
      decoder.reconstruct();
    } catch (const ReconstructBeforeComplete& e) {
      thrown = true;
    }
    assert(thrown);
  }
  // the data itself is still recoverable
  assert(feed_until_complete(encoder, decoder, 1000) > 0);
  assert(decoder.reconstruct() == data);
}

// Droplets made from different data must never be reconstructed as one
static void test_conflicting_droplets() {
  fmt::print("test_conflicting_droplets begin\n");
  {
    // K == 1, every droplet carries the chunk itself
    GlassDecoder decoder{};
    assert(decoder.ingest(Droplet{1, 1, 0, {1, 2, 3}}) ==
           IngestStatus::RESOLVED);
    assert(decoder.ingest(Droplet{2, 1, 0, {1, 2, 3}}) ==
           IngestStatus::REDUNDANT);
    assert(!decoder.has_conflict());
    assert(decoder.ingest(Droplet{3, 1, 0, {1, 2, 4}}) ==
           IngestStatus::CONFLICT);
    assert(decoder.has_conflict());
    assert(!decoder.is_complete());
    assert(decoder.ingest(Droplet{4, 1, 0, {1, 2, 3}}) ==
           IngestStatus::CONFLICT);
    bool thrown = false;
    try {
      decoder.reconstruct();
    } catch (const ReconstructBeforeComplete& e) {
      thrown = true;
    }
    assert(thrown);
    assert(decoder.get_latest_stats().n_conflicts == 1);
  }
  {
    // two pending droplets over both chunks, the third resolves one of them
    // and both pending droplets then disagree on the other
    const auto degree_for_seed = [](uint32_t seed) {
      return seed == 3 ? 1u : 2u;
    };
    auto scheme = std::make_shared<const DropletScheme>(2, degree_for_seed);
    GlassDecoder decoder{[scheme](uint32_t) { return scheme; }};
    assert(decoder.ingest(Droplet{1, 2, 0, {1, 1}}) == IngestStatus::PENDING);
    assert(decoder.ingest(Droplet{2, 2, 0, {2, 2}}) == IngestStatus::PENDING);
    assert(decoder.ingest(Droplet{3, 2, 0, {3, 3}}) == IngestStatus::CONFLICT);
    assert(decoder.has_conflict());
    assert(!decoder.is_complete());
  }
  {
    // two files of the same size with overlapping seed streams
    const auto data_a = GenericHelper::createRandomDataBuffer(1000, 20);
    const auto data_b = GenericHelper::createRandomDataBuffer(1000, 21);
    FountainEncoder encoder_a{data_a, make_options(100, 1)};
    FountainEncoder encoder_b{data_b, make_options(100, 2)};
    GlassDecoder decoder{};
    IngestStatus status = IngestStatus::PENDING;
    for (int i = 0; i < 1000 && status != IngestStatus::CONFLICT; i++) {
      auto& encoder = i % 2 == 0 ? encoder_a : encoder_b;
      status = decoder.ingest(encoder.next_droplet());
      assert(!decoder.is_complete());
    }
    assert(status == IngestStatus::CONFLICT);
    assert(decoder.get_latest_stats().n_conflicts >= 1);
    assert(decoder.ingest(encoder_a.next_droplet()) == IngestStatus::CONFLICT);
  }
  fmt::print("test_conflicting_droplets end\n");
}

// Memory is only used for chunks that are actually known
static void test_huge_num_chunks() {
  GlassDecoder decoder{};
  const auto status = decoder.ingest(Droplet{7, 1000000, 0, {0, 0, 0}});
  assert(status == IngestStatus::PENDING || status == IngestStatus::RESOLVED);
  assert(decoder.num_chunks() == 1000000);
  assert(decoder.resolved_count() <= 1);
  assert(!decoder.is_complete());
  // K * chunk size above MAX_TRANSFER_SIZE
  GlassDecoder decoder2{};
  assert(decoder2.ingest(Droplet{7, 1000000, 0, std::vector<uint8_t>(2046)}) ==
         IngestStatus::INCONSISTENT_PARAMETERS);
  assert(!decoder2.has_parameters());
  assert(decoder2.get_latest_stats().n_rejected == 1);
}

}  // namespace TestFountain

int main(int argc, char* argv[]) {
  std::cout << "Tests for qrfountain\n";
  int opt;
  int test_mode = 0;
  while ((opt = getopt(argc, argv, "m:")) != -1) {
    switch (opt) {
      case 'm':
        test_mode = atoi(optarg);
        break;
      default: /* '?' */
        std::cout << "Usage: Unit tests for the fountain code. -m 0,1,2,3 "
                     "test mode: 0==ALL, 1==Sampler only 2==Wire only "
                     "3==Encoder/Decoder only\n";
        return 1;
    }
  }
  if (sodium_init() < 0) {
    std::cerr << "Cannot init libsodium\n";
    return 1;
  }
  try {
    if (test_mode == 0 || test_mode == 1) {
      std::cout << "Testing sampler" << std::endl;
      TestSampler::test_seeded_random();
      TestSampler::test_degree_sampler();
      TestSampler::test_chunk_selector();
    }
    if (test_mode == 0 || test_mode == 2) {
      std::cout << "Testing wire format" << std::endl;
      TestWire::test_wire_codec();
      TestWire::test_manifest();
      TestWire::test_file_framing();
    }
    if (test_mode == 0 || test_mode == 3) {
      std::cout << "Testing encoder/decoder" << std::endl;
      TestFountain::test_encoder();
      TestFountain::test_boundaries();
      TestFountain::test_fixed_degree_scenario();
      TestFountain::test_degree_one();
      TestFountain::test_monotonic_and_idempotent();
      TestFountain::test_decoder_rejects();
      TestFountain::test_conflicting_droplets();
      TestFountain::test_huge_num_chunks();
      TestFountain::test_round_trip();
    }
  } catch (std::exception& e) {
    std::cerr << "Error: " << std::string(e.what());
    exit(1);
  }
  std::cout << "All Tests Passing\n";
  return 0;
}
