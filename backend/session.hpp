/*
 * session.hpp: Loaded-binary session
 *
 * Owns everything derived from one load (image, analysis, vault and the
 * row sources over them) as a single immutable State that is swapped in
 * atomically when a load succeeds.  Readers hold a shared_ptr to the
 * state they started with; a failed or cancelled load leaves the
 * current state untouched.
 */

#ifndef DS_SESSION_H
#define DS_SESSION_H

#include "loader.hpp"
#include "processor.hpp"
#include "scroll.hpp"
#include "vault.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace session {

enum class LoadError : uint8_t {
    NONE,
    IO,             // file could not be read
    BAD_IMAGE,      // no usable sections or architecture
    NO_CODE,        // no executable section
    BAD_DEBUG,      // debug file malformed
    CANCELLED,      // superseded by a newer load
};

struct LoadStatus {
    LoadError   code = LoadError::NONE;
    std::string message;

    bool ok() const { return code == LoadError::NONE; }

    static LoadStatus fail(LoadError code, std::string message)
    {
        return LoadStatus{code, std::move(message)};
    }
};

struct LoadOptions {
    std::string         path;
    std::string         debug_path;     // empty: "<path>.dbg.json" if present
    loader::RawOptions  raw;
};

/* Everything derived from one load. */
struct State {
    std::string                          name;
    uint64_t                             generation = 0;
    std::shared_ptr<const image::Image>  image;
    proc::Analysis                       analysis;
    vault::Vault                         vault;
    std::unique_ptr<scroll::ListingSource> listing;
    std::unique_ptr<scroll::HexSource>     hex;
};

class Session {
public:
    explicit Session(proc::ProcessorConfig cfg = {}) : cfg_(cfg) {}
    ~Session();

    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;

    /* Analyse an already built image with its debug records. */
    LoadStatus load(std::shared_ptr<const image::Image> image,
                    const vault::Builder &debug, std::string name = {});

    /* Read a raw image (and its debug JSON) from disk, then load(). */
    LoadStatus load_file(const LoadOptions &opts);

    /* Cancel the load in flight, if any. */
    void cancel();

    /* Current state; null before the first successful load. */
    std::shared_ptr<const State> current() const;

    /* Listing row of the entry starting at addr, for click-to-navigate. */
    std::optional<size_t> resolve_reference(uint64_t addr) const;

    const proc::ProcessorConfig &config() const { return cfg_; }
    void set_config(const proc::ProcessorConfig &cfg);

private:
    mutable std::mutex                  mutex_;
    std::shared_ptr<const State>        state_;
    std::shared_ptr<std::atomic<bool>>  inflight_;
    proc::ProcessorConfig               cfg_;
    uint64_t                            generation_ = 0;
};

const char *error_name(LoadError code);

} // namespace session

#endif // DS_SESSION_H
