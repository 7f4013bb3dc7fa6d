/*
 * processor.cpp: Disassembly orchestrator
 */

#include "processor.hpp"
#include "pool.hpp"

#include <algorithm>
#include <cinttypes>
#include <cstdio>
#include <map>
#include <mutex>
#include <set>
#include <utility>

namespace proc {

using arch::Flow;
using arch::Instruction;

/* ======================================================================== */
/* Analysis queries                                                          */
/* ======================================================================== */

std::optional<size_t> Analysis::find(uint64_t addr) const
{
    auto it = std::lower_bound(stream.begin(), stream.end(), addr,
                               [](const Instruction &i, uint64_t a) { return i.address < a; });
    if (it == stream.end() || it->address != addr) return std::nullopt;
    return (size_t)(it - stream.begin());
}

std::optional<size_t> Analysis::containing(uint64_t addr) const
{
    auto it = std::upper_bound(stream.begin(), stream.end(), addr,
                               [](uint64_t a, const Instruction &i) { return a < i.address; });
    if (it == stream.begin()) return std::nullopt;
    --it;
    if (addr >= it->end()) return std::nullopt;
    return (size_t)(it - stream.begin());
}

size_t Analysis::lower_bound(uint64_t addr) const
{
    auto it = std::upper_bound(stream.begin(), stream.end(), addr,
                               [](uint64_t a, const Instruction &i) { return a < i.end(); });
    return (size_t)(it - stream.begin());
}

const char *status_name(RunStatus status)
{
    switch (status) {
    case RunStatus::OK:        return "ok";
    case RunStatus::CANCELLED: return "cancelled";
    case RunStatus::NO_ARCH:   return "unsupported architecture";
    case RunStatus::NO_CODE:   return "no executable code";
    }
    return "?";
}

const char *origin_name(SeedOrigin origin)
{
    switch (origin) {
    case SeedOrigin::ENTRY:      return "entry";
    case SeedOrigin::SYMBOL:     return "symbol";
    case SeedOrigin::DISCOVERED: return "discovered";
    case SeedOrigin::POINTER:    return "pointer";
    }
    return "?";
}

namespace {

/* ======================================================================== */
/* Confirmed coverage                                                        */
/* ======================================================================== */

/*
 * Instructions confirmed by earlier merges.  Sweeps read it while the
 * merge pass is the only writer.
 */
class Coverage {
public:
    bool is_start(uint64_t addr) const
    {
        std::lock_guard lock(mutex_);
        return entries_.count(addr) != 0;
    }

    /* addr lies inside a confirmed entry but not at its start */
    bool inside(uint64_t addr) const
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.upper_bound(addr);
        if (it == entries_.begin()) return false;
        --it;
        return it->first != addr && addr < it->second.end();
    }

    std::optional<uint64_t> next_start(uint64_t addr) const
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.upper_bound(addr);
        if (it == entries_.end()) return std::nullopt;
        return it->first;
    }

    void insert(Instruction insn)
    {
        std::lock_guard lock(mutex_);
        uint64_t a = insn.address;
        entries_.emplace(a, std::move(insn));
    }

    Stream take()
    {
        std::lock_guard lock(mutex_);
        Stream out;
        out.reserve(entries_.size());
        for (auto &[addr, insn] : entries_)
            out.push_back(std::move(insn));
        entries_.clear();
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::map<uint64_t, Instruction> entries_;
};

/* ======================================================================== */
/* Sweep                                                                     */
/* ======================================================================== */

struct Run {
    Seed seed;
    std::vector<Instruction> insns;
    std::vector<std::pair<size_t, uint64_t>> targets;     // (insn index, direct target)
    std::vector<std::pair<size_t, uint64_t>> pointers;    // (insn index, loaded code pointer)
    bool fell_into_data = false;
};

struct Context {
    const image::Image     &image;
    const arch::Arch       &arch;
    const ProcessorConfig  &cfg;
    const Coverage         &coverage;
    const std::atomic<bool> &cancel;
};

bool in_code(const image::Image &img, uint64_t addr)
{
    const image::Section *sec = img.section_for(addr);
    return sec && sec->executable();
}

/* Code pointer loaded by an indirect jump or call through memory */
std::optional<uint64_t> pointer_target(const Context &ctx, const Instruction &insn)
{
    for (auto &op : insn.operands) {
        if (op.kind != arch::OperandKind::MEM) continue;
        uint64_t slot;
        if (op.flags & arch::OPF_PCREL)
            slot = op.target;
        else if (!op.reg && !op.index)
            slot = (uint64_t)op.value;
        else
            continue;
        auto ptr = ctx.image.read_pointer(slot, ctx.arch.pointer_size);
        if (ptr && in_code(ctx.image, *ptr))
            return ptr;
    }
    return std::nullopt;
}

bool has_direct_target(const Instruction &insn)
{
    return insn.has_target &&
           (insn.flow == Flow::BRANCH || insn.flow == Flow::COND_BRANCH ||
            insn.flow == Flow::CALL);
}

Run sweep(const Context &ctx, Seed seed)
{
    Run run;
    run.seed = seed;

    uint64_t addr = seed.addr;
    unsigned invalid_run = 0;
    bool last = false;              // next entry is a delay slot, then stop

    while (!ctx.cancel.load(std::memory_order_relaxed)) {
        const image::Section *sec = ctx.image.section_for(addr);
        if (!sec || !sec->executable()) break;
        if (!run.insns.empty() && ctx.coverage.is_start(addr)) break;
        if (ctx.coverage.inside(addr)) break;

        auto data = ctx.image.bytes_from(addr);
        if (data.empty()) break;

        Instruction insn = arch::decode(ctx.arch, data, addr, ctx.image.decode_flags());
        addr = insn.end();

        if (insn.is_error) {
            run.insns.push_back(std::move(insn));
            if (++invalid_run > ctx.cfg.invalid_run_limit) {
                run.insns.resize(run.insns.size() - invalid_run);
                run.fell_into_data = true;
                break;
            }
            if (last) break;
            continue;
        }
        invalid_run = 0;

        size_t idx = run.insns.size();
        if (has_direct_target(insn))
            run.targets.emplace_back(idx, insn.target);
        if (ctx.cfg.indirect == IndirectPolicy::FOLLOW_POINTERS &&
            insn.flow == Flow::INDIRECT) {
            if (auto ptr = pointer_target(ctx, insn))
                run.pointers.emplace_back(idx, *ptr);
        }

        bool end = insn.flow == Flow::RETURN || insn.flow == Flow::BRANCH;
        if (insn.flow == Flow::BRANCH && insn.has_target && ctx.cfg.sweep_past_branch) {
            bool own = insn.target >= seed.addr && insn.target < addr;
            end = own || ctx.coverage.is_start(insn.target);
        }
        run.insns.push_back(std::move(insn));

        if (last) break;
        if (end) {
            if (ctx.arch.branch_delay_slots == 0) break;
            last = true;
        }
    }
    return run;
}

/* ======================================================================== */
/* Seeding                                                                   */
/* ======================================================================== */

bool seed_before(const Seed &a, const Seed &b)
{
    if (a.origin != b.origin) return a.origin < b.origin;
    return a.addr < b.addr;
}

std::vector<Seed> initial_seeds(const image::Image &img)
{
    std::vector<Seed> seeds;
    if (in_code(img, img.entry))
        seeds.push_back({img.entry, SeedOrigin::ENTRY});

    for (auto &s : img.symbols) {
        if (s.kind != image::SymbolKind::FUNCTION && s.kind != image::SymbolKind::ENTRY)
            continue;
        if (s.addr == img.entry || !in_code(img, s.addr))
            continue;
        seeds.push_back({s.addr, SeedOrigin::SYMBOL});
    }

    if (seeds.empty()) {
        for (auto &sec : img.sections)
            if (sec.executable())
                seeds.push_back({sec.start, SeedOrigin::SYMBOL});
        fprintf(stderr, "[dissect] No entry point or function symbols, "
                "seeding %zu section starts\n", seeds.size());
    }
    return seeds;
}

} // namespace

/* ======================================================================== */
/* Processor                                                                 */
/* ======================================================================== */

std::optional<Analysis> Processor::run(std::shared_ptr<const image::Image> image,
                                       const std::atomic<bool> &cancel,
                                       RunStatus *status) const
{
    auto fail = [&](RunStatus st) -> std::optional<Analysis> {
        if (status) *status = st;
        return std::nullopt;
    };

    if (!image) return fail(RunStatus::NO_CODE);
    const arch::Arch *a = arch::arch_for_machine(image->machine);
    if (!a) return fail(RunStatus::NO_ARCH);

    bool any_code = std::any_of(image->sections.begin(), image->sections.end(),
                                [](const image::Section &s) { return s.executable(); });
    if (!any_code) return fail(RunStatus::NO_CODE);

    Analysis out;
    out.image = image;
    out.arch = a;

    Coverage coverage;
    Context ctx{*image, *a, cfg_, coverage, cancel};
    pool::WorkerPool workers(cfg_.workers);

    std::set<uint64_t> swept;
    std::vector<Seed> pending = initial_seeds(*image);

    while (!pending.empty()) {
        if (cancel.load()) return fail(RunStatus::CANCELLED);

        /* Sweep this round's seeds in parallel; each task owns one slot */
        std::vector<Run> runs(pending.size());
        for (size_t i = 0; i < pending.size(); i++) {
            swept.insert(pending[i].addr);
            out.seeds.push_back(pending[i]);
            workers.submit([&ctx, &runs, seed = pending[i], i] {
                runs[i] = sweep(ctx, seed);
            });
        }
        workers.wait_idle();
        if (cancel.load()) return fail(RunStatus::CANCELLED);

        out.stats.rounds++;
        out.stats.sweeps += runs.size();

        /* Single-writer merge in priority order */
        std::map<uint64_t, SeedOrigin> found;
        auto propose = [&](uint64_t addr, SeedOrigin origin) {
            auto [it, added] = found.emplace(addr, origin);
            if (!added && origin < it->second)
                it->second = origin;
        };

        for (auto &run : runs) {
            if (run.fell_into_data) out.stats.data_runs++;

            size_t stop = run.insns.size();
            for (size_t i = 0; i < run.insns.size(); i++) {
                Instruction &insn = run.insns[i];
                if (coverage.is_start(insn.address) || coverage.inside(insn.address)) {
                    stop = i;
                    out.stats.truncated_runs++;
                    break;
                }
                auto next = coverage.next_start(insn.address);
                if (next && *next < insn.end()) {
                    stop = i;
                    out.stats.truncated_runs++;
                    if (cfg_.overlap == OverlapPolicy::KEEP_CONFIRMED) {
                        coverage.insert(arch::make_invalid(image->bytes_from(insn.address),
                                                           insn.address,
                                                           (unsigned)(*next - insn.address)));
                    }
                    break;
                }
                coverage.insert(std::move(insn));
            }
            out.stats.discarded += run.insns.size() - stop;

            for (auto &[idx, target] : run.targets)
                if (idx < stop) propose(target, SeedOrigin::DISCOVERED);
            for (auto &[idx, target] : run.pointers)
                if (idx < stop) propose(target, SeedOrigin::POINTER);
        }

        pending.clear();
        for (auto &[addr, origin] : found) {
            if (swept.count(addr) || !in_code(*image, addr)) continue;
            if (coverage.is_start(addr) || coverage.inside(addr)) continue;
            pending.push_back({addr, origin});
        }
        std::sort(pending.begin(), pending.end(), seed_before);
    }

    out.stream = coverage.take();
    for (auto &insn : out.stream) {
        if (insn.is_error) out.stats.invalid++;
        else out.stats.instructions++;
    }

    fprintf(stderr, "[dissect] Processed %zu instructions (%zu invalid) "
            "from %zu seeds in %zu rounds\n",
            out.stats.instructions, out.stats.invalid,
            out.seeds.size(), out.stats.rounds);

    if (status) *status = RunStatus::OK;
    return out;
}

} // namespace proc
