#include "hash_command.hpp"
#include "helpers.hpp"

#include "cache_store.hpp"
#include "dct_basis.hpp"
#include "logger.hpp"
#include "perceptual_hash.hpp"
#include "pipeline.hpp"
#include "progress_tracker.hpp"

#include <rang.hpp>

#include <chrono>
#include <iostream>
#include <memory>

using namespace rang;
using namespace phashcache;

int phashcache_app::handleHashCommand(const Arguments& args)
{
    bool cursorHidden = false;

    try {
        auto start = std::chrono::steady_clock::now();

        // The checkpoint file is opened first: without it there is nothing to resume into
        CacheStore store(args.output);
        const CacheMap cache = store.load();

        const auto candidates = readInputList(args.input);
        const auto work = computeWorkSet(candidates, cache);

        PHASHCACHE_INFO("Hash", withCommas(candidates.size()), " candidate path(s), ",
            withCommas(cache.size()), " already cached, ", withCommas(work.size()), " to compute");

        const auto basis = makeDctBasis();
        const PerceptualHasher hasher(basis);

        PipelineOptions options;
        options.threads = args.threads;
        options.queueCapacity = args.queueCapacity;
        HashPipeline pipeline(hasher, store, options);

        std::cerr << "Computing phashes...\n";

        // Nothing is drawn until the tracker first reports progress
        indicators::ProgressBar progressBar = bar("Hashing ", work.size());
        std::unique_ptr<ProgressTracker> tracker;

        if (args.showProgress && !work.empty()) {
            hideCursor();
            cursorHidden = true;

            tracker = std::make_unique<ProgressTracker>(work.size(), [&progressBar](const ProgressInfo& info) {
                progressBar.set_progress(info.finished());

                if (info.failedImages > 0 || info.rejectedImages > 0) {
                    progressBar.set_option(indicators::option::ForegroundColor{ indicators::Color::yellow });
                    progressBar.set_option(indicators::option::PostfixText{
                        "(" + std::to_string(info.failedImages + info.rejectedImages) + " skipped)" });
                }
            });
        }

        const PipelineStats stats = pipeline.run(work, tracker.get());

        if (tracker) {
            tracker->forceUpdate();
            if (!progressBar.is_completed()) progressBar.mark_as_completed();
            showCursor();
            cursorHidden = false;
        }

        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        std::cerr << fg::green << "\nCompleted " << withCommas(stats.written) << " new image(s) in "
                  << duration.count() / 1000.0 << " seconds (" << pipeline.threadCount() << " worker thread(s))\n"
                  << fg::reset;

        if (stats.failed > 0) {
            std::cerr << fg::yellow << "Warning: " << withCommas(stats.failed) << " image(s) failed to process"
                      << fg::reset << '\n';
        }
        if (stats.rejected > 0) {
            std::cerr << fg::yellow << "Warning: " << withCommas(stats.rejected)
                      << " path(s) contain a tab or newline and were not written" << fg::reset << '\n';
        }

        PHASHCACHE_INFO("Hash", withCommas(cache.size() + stats.written), " hash(es) recorded in ", store.path());
    }
    catch (const std::exception& e) {
        if (cursorHidden) showCursor();
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
