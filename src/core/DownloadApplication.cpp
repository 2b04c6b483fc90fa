#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include "core/DownloadApplication.hpp"
#include "core/DownloadError.hpp"
#include "core/StateStore.hpp"
#include "util/CurlHttpClient.hpp"
#include "aux/WorkerGroup.hpp"
#include "ui/UI.hpp"

namespace
{
    volatile std::sig_atomic_t pauseRequested = 0;

    void onPauseSignal(int)
    {
        pauseRequested = 1;
    }

    // Destroyed before the worker group on every way out of execute(): a download still running
    // (the UI threw) is interrupted so the group's joins return promptly
    class InterruptOnExit
    {
    public:
        InterruptOnExit(SegmentedDownload &download, const std::atomic<bool> &finished)
            : _download(download), _finished(finished)
        {
        }

        ~InterruptOnExit()
        {
            if (!_finished.load())
            {
                _download.interrupt();
            }

            std::signal(SIGINT, SIG_DFL);
            std::signal(SIGTERM, SIG_DFL);
        }

    private:
        SegmentedDownload &_download;
        const std::atomic<bool> &_finished;
    };
}

DownloadApplication::DownloadApplication(const DownloadConfig &config)
    : _config(config)
{
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

DownloadApplication::~DownloadApplication()
{
    curl_global_cleanup();
}

int DownloadApplication::run()
{
    CurlHttpClient client(_config.connectTimeoutSecs, _config.stallTimeoutSecs);
    StateStore store(_config.stateFilePath);

    try
    {
        SegmentedDownload download(client, store, _config.url, _config.segmentCount, _config.outputDirectory);

        // A saved record for this file name means a later invocation of an earlier download
        bool resume = !_config.forceRestart && store.hasRecord(download.getTarget().fileName);

        DownloadOutcome outcome = execute(download, resume);
        return report(download, outcome);
    }
    catch (const DownloadError &e)
    {
        spdlog::error("{}: {}", errorKindToString(e.getKind()), e.what());
        std::cerr << "segdl: " << errorKindToString(e.getKind()) << ": " << e.what() << "\n";
        return e.getKind() == ErrorKind::MERGE ? SEGDL_EXIT_MERGE : SEGDL_EXIT_CONFIGURATION;
    }
    catch (const std::exception &e)
    {
        spdlog::critical("Unexpected failure: {}", e.what());
        std::cerr << "segdl: unexpected failure: " << e.what() << "\n";
        return SEGDL_EXIT_FAILURE;
    }
}

// Runs the coordinator on its own thread so the UI (or the signal watcher) keeps the main one
DownloadOutcome DownloadApplication::execute(SegmentedDownload &download, bool resume)
{
    std::atomic<bool> finished{false};
    DownloadOutcome outcome = DownloadOutcome::INCOMPLETE;
    std::exception_ptr failure;

    std::signal(SIGINT, onPauseSignal);
    std::signal(SIGTERM, onPauseSignal);

    // Declared in this order so the interrupt happens before the group joins
    WorkerGroup threads;
    InterruptOnExit interruptOnExit(download, finished);

    threads.spawn([&]()
                  {
                      try
                      {
                          outcome = resume ? download.reinstate() : download.download();
                      }
                      catch (...)
                      {
                          // Rethrown on the main thread after join
                          failure = std::current_exception();
                      }
                      finished.store(true);
                  });

    threads.spawn([&]()
                  {
                      while (!finished.load())
                      {
                          if (pauseRequested)
                          {
                              pauseRequested = 0;
                              download.interrupt();
                          }
                          std::this_thread::sleep_for(std::chrono::milliseconds(50));
                      }
                  });

    if (_config.useUI)
    {
        UI ui(download, finished);
        ui.run();
    }

    threads.joinAll();

    if (failure)
    {
        std::rethrow_exception(failure);
    }

    return outcome;
}

int DownloadApplication::report(const SegmentedDownload &download, DownloadOutcome outcome) const
{
    const Target &target = download.getTarget();

    if (download.persistFailed())
    {
        std::cerr << "segdl: warning: state could not be saved to " << _config.stateFilePath
                  << "; this download cannot be resumed\n";
    }

    switch (outcome)
    {
    case DownloadOutcome::COMPLETED:
        std::cout << "Downloaded " << download.artifactPath() << " (" << target.totalSize << " bytes)\n";
        return SEGDL_EXIT_OK;

    case DownloadOutcome::PAUSED:
        std::cout << "Paused " << target.fileName << "; run the same command again to resume\n";
        return SEGDL_EXIT_OK;

    case DownloadOutcome::INCOMPLETE:
        for (const auto &result : download.getResults())
        {
            if (!result.second.isComplete())
            {
                std::cerr << "segdl: segment " << result.first << ": " << result.second.reason << "\n";
            }
        }
        std::cerr << "segdl: " << target.fileName << " is incomplete; run the same command again to resume\n";
        return SEGDL_EXIT_INCOMPLETE;
    }

    return SEGDL_EXIT_INCOMPLETE;
}
