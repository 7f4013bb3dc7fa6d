/*
 * session.cpp: Loaded-binary session
 */

#include "session.hpp"

#include <cstdio>

namespace session {

const char *error_name(LoadError code)
{
    switch (code) {
    case LoadError::NONE:      return "none";
    case LoadError::IO:        return "io";
    case LoadError::BAD_IMAGE: return "bad_image";
    case LoadError::NO_CODE:   return "no_code";
    case LoadError::BAD_DEBUG: return "bad_debug";
    case LoadError::CANCELLED: return "cancelled";
    }
    return "?";
}

Session::~Session()
{
    cancel();
}

void Session::cancel()
{
    std::lock_guard lock(mutex_);
    if (inflight_)
        inflight_->store(true);
}

void Session::set_config(const proc::ProcessorConfig &cfg)
{
    std::lock_guard lock(mutex_);
    cfg_ = cfg;
}

std::shared_ptr<const State> Session::current() const
{
    std::lock_guard lock(mutex_);
    return state_;
}

std::optional<size_t> Session::resolve_reference(uint64_t addr) const
{
    auto st = current();
    if (!st) return std::nullopt;
    return st->listing->row_of_entry(addr);
}

LoadStatus Session::load(std::shared_ptr<const image::Image> image,
                         const vault::Builder &debug, std::string name)
{
    if (!image)
        return LoadStatus::fail(LoadError::BAD_IMAGE, "no image");

    auto flag = std::make_shared<std::atomic<bool>>(false);
    proc::ProcessorConfig cfg;
    {
        std::lock_guard lock(mutex_);
        if (inflight_)
            inflight_->store(true);
        inflight_ = flag;
        cfg = cfg_;
    }

    auto st = std::make_shared<State>();
    st->name = std::move(name);
    st->image = image;
    st->vault = debug.build(image);

    proc::RunStatus rs = proc::RunStatus::OK;
    auto analysis = proc::Processor(cfg).run(image, *flag, &rs);
    if (!analysis) {
        LoadStatus status;
        switch (rs) {
        case proc::RunStatus::CANCELLED:
            status = LoadStatus::fail(LoadError::CANCELLED, "load cancelled");
            break;
        case proc::RunStatus::NO_CODE:
            status = LoadStatus::fail(LoadError::NO_CODE, "image has no executable section");
            break;
        default:
            status = LoadStatus::fail(LoadError::BAD_IMAGE,
                                      std::string("cannot analyse image: ") + proc::status_name(rs));
            break;
        }
        fprintf(stderr, "[dissect] Load failed: %s\n", status.message.c_str());
        std::lock_guard lock(mutex_);
        if (inflight_ == flag)
            inflight_.reset();
        return status;
    }

    st->analysis = std::move(*analysis);
    st->listing = std::make_unique<scroll::ListingSource>(st->analysis, st->vault);
    st->hex = std::make_unique<scroll::HexSource>(*st->image);

    std::lock_guard lock(mutex_);
    if (inflight_ != flag || flag->load()) {
        fprintf(stderr, "[dissect] Load of %s superseded\n", st->name.c_str());
        return LoadStatus::fail(LoadError::CANCELLED, "load superseded");
    }
    inflight_.reset();
    st->generation = ++generation_;
    state_ = std::move(st);
    fprintf(stderr, "[dissect] Loaded %s: %zu listing rows\n",
            state_->name.c_str(), state_->listing->size());
    return LoadStatus{};
}

LoadStatus Session::load_file(const LoadOptions &opts)
{
    loader::DebugInfo debug;
    std::string err;

    std::string debug_path = opts.debug_path;
    if (debug_path.empty()) {
        std::string dflt = loader::default_debug_path(opts.path);
        if (loader::file_exists(dflt))
            debug_path = dflt;
    }
    if (!debug_path.empty() &&
        !loader::load_debug_json(debug_path.c_str(), debug, err)) {
        fprintf(stderr, "[dissect] %s\n", err.c_str());
        return LoadStatus::fail(LoadError::BAD_DEBUG, err);
    }

    if (opts.raw.machine == arch::Machine::UNKNOWN)
        return LoadStatus::fail(LoadError::BAD_IMAGE, "no architecture given");

    auto img = loader::load_raw(opts.path.c_str(), opts.raw, std::move(debug.symbols), err);
    if (!img) {
        fprintf(stderr, "[dissect] %s\n", err.c_str());
        return LoadStatus::fail(LoadError::IO, err);
    }

    return load(std::make_shared<const image::Image>(std::move(*img)),
                debug.vault, opts.path);
}

} // namespace session
