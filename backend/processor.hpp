/*
 * processor.hpp: Disassembly orchestrator
 *
 * Turns a binary image into an address-ordered instruction stream.
 * Seeds (entry point, function symbols, discovered direct targets) are
 * swept in rounds: each round decodes its seeds as independent tasks
 * on a worker pool, then a single-writer merge folds the runs into the
 * confirmed stream in priority order and collects the next round's
 * seeds from the direct targets of the merged instructions.
 */

#ifndef DS_PROCESSOR_H
#define DS_PROCESSOR_H

#include "arch.hpp"
#include "image.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace proc {

/* How a run that collides with confirmed code is merged. */
enum class OverlapPolicy : uint8_t {
    KEEP_CONFIRMED,     // misaligned prefix becomes an invalid entry, run stops
    DISCARD_RUN,        // rest of the run is dropped
};

/* What indirect control flow contributes to the seed set. */
enum class IndirectPolicy : uint8_t {
    IGNORE,
    FOLLOW_POINTERS,    // read code pointers of absolute/PC-relative memory operands
};

struct ProcessorConfig {
    unsigned       workers = 0;             // 0 = hardware concurrency
    unsigned       invalid_run_limit = 8;   // consecutive invalid decodes before giving up
    OverlapPolicy  overlap = OverlapPolicy::KEEP_CONFIRMED;
    IndirectPolicy indirect = IndirectPolicy::IGNORE;
    bool           sweep_past_branch = false;   // keep decoding after a direct jump to new code
};

/* Seed priority classes, highest first. */
enum class SeedOrigin : uint8_t {
    ENTRY,
    SYMBOL,
    DISCOVERED,
    POINTER,
};

struct Seed {
    uint64_t   addr = 0;
    SeedOrigin origin = SeedOrigin::DISCOVERED;

    bool operator==(const Seed &) const = default;
};

struct Stats {
    size_t rounds = 0;
    size_t sweeps = 0;
    size_t instructions = 0;
    size_t invalid = 0;
    size_t data_runs = 0;           // sweeps abandoned after too many invalid decodes
    size_t truncated_runs = 0;      // runs cut at a confirmed boundary
    size_t discarded = 0;           // decoded entries dropped at merge
};

using Stream = std::vector<arch::Instruction>;

struct Analysis {
    std::shared_ptr<const image::Image> image;
    const arch::Arch *arch = nullptr;
    Stream            stream;       // sorted, non-overlapping
    std::vector<Seed> seeds;        // swept seeds in sweep order
    Stats             stats;

    /* Index of the entry starting exactly at addr. */
    std::optional<size_t> find(uint64_t addr) const;

    /* Index of the entry containing addr. */
    std::optional<size_t> containing(uint64_t addr) const;

    /* Index of the first entry ending after addr (stream.size() if none). */
    size_t lower_bound(uint64_t addr) const;
};

enum class RunStatus : uint8_t {
    OK,
    CANCELLED,
    NO_ARCH,
    NO_CODE,
};

class Processor {
public:
    explicit Processor(ProcessorConfig cfg = {}) : cfg_(cfg) {}

    /*
     * Analyse the image.  Returns nothing when cancelled or when the
     * image cannot be processed; *status (if given) says why.
     */
    std::optional<Analysis> run(std::shared_ptr<const image::Image> image,
                                const std::atomic<bool> &cancel,
                                RunStatus *status = nullptr) const;

    const ProcessorConfig &config() const { return cfg_; }

private:
    ProcessorConfig cfg_;
};

const char *status_name(RunStatus status);
const char *origin_name(SeedOrigin origin);

} // namespace proc

#endif // DS_PROCESSOR_H
