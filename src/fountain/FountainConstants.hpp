#ifndef QRFOUNTAIN_FOUNTAIN_CONSTANTS_HPP
#define QRFOUNTAIN_FOUNTAIN_CONSTANTS_HPP

#include <cstdint>
#include <limits>

namespace qrfountain {

// Upper limit for the n of chunks of one transfer. With 1024 byte chunks this
// is roughly a 1GB payload, way more than anybody wants to push through a
// screen. Values above are rejected by the wire parser.
static constexpr uint32_t MAX_NUM_CHUNKS = 1000000;

// Upper limit for K * chunk size of one transfer (the decoded size). Droplets
// announcing more are rejected before anything is allocated for them.
static constexpr uint64_t MAX_TRANSFER_SIZE = 512ull * 1024 * 1024;

// The top 8 bits of a data droplet seed are the transfer tag, the tx gives
// every file of a session its own tag. Droplets of equally sized files are
// then never mixed up by the rx.
static constexpr int SEED_TAG_SHIFT = 24;
static constexpr uint32_t SEED_VALUE_MASK = 0x00FFFFFF;

// Reserved seed that marks a manifest droplet (not a data droplet). The
// encoder seed source never hands it out.
static constexpr uint32_t MANIFEST_SEED = std::numeric_limits<uint32_t>::max();

// Separates seed|num_chunks|padding|payload on the wire
static constexpr char WIRE_DELIMITER = '|';
static constexpr int WIRE_N_FIELDS = 4;

static constexpr uint32_t DEFAULT_CHUNK_SIZE = 1024;
// Robust soliton parameters, c and delta (delta bounds the decode failure
// probability)
static constexpr double DEFAULT_SOLITON_C = 0.05;
static constexpr double DEFAULT_SOLITON_DELTA = 0.05;
// Seed source start value if none is given
static constexpr uint32_t DEFAULT_START_SEED = 1337;

// File name of the legacy manifest "file" whose body is the n of files
static constexpr const char* LEGACY_MANIFEST_FILENAME = "__FILE_COUNT__";

}  // namespace qrfountain

#endif  // QRFOUNTAIN_FOUNTAIN_CONSTANTS_HPP
