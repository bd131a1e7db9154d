#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#else
#include <linux/limits.h>
#include <unistd.h>
#endif

#include "../common.h"
#include "../core/anchor_interaction_controller.h"
#include "../core/iscene_host.h"
#include "../logging.h"
#include "host_config.h"
#include "provider_loader.h"
#include "provider_subsystem.h"

using namespace xanchor;
namespace fs = std::filesystem;

static std::atomic<bool> g_stop_requested{false};

static void HandleSignal(int) { g_stop_requested.store(true); }

// Scene host without a renderer: anchor visuals are log lines
class LoggingSceneHost : public core::ISceneHost {
   public:
    void SpawnAnchorVisual(const core::AnchorRecord& record) override {
        std::ostringstream msg;
        msg << "Anchor visual spawned: " << record.handle << " at (" << record.world_pose.position.x << ", "
            << record.world_pose.position.y << ", " << record.world_pose.position.z << ")";
        LOG_INFO(msg.str().c_str());
    }

    void UpdateAnchorVisual(const core::AnchorRecord& record) override {
        std::ostringstream msg;
        msg << "Anchor " << record.handle << ": " << core::TrackingStateToString(record.tracking_state)
            << (record.is_persisted ? ", persisted as " + record.persisted_name : std::string(", not persisted"));
        LOG_DEBUG(msg.str().c_str());
    }

    void DestroyAnchorVisual(core::AnchorHandle handle) override {
        LOG_INFO(("Anchor visual destroyed: " + std::to_string(handle)).c_str());
    }
};

class AnchorHost {
   public:
    explicit AnchorHost(host::HostConfig config) : config_(std::move(config)) {}

    bool Initialize() {
        LOG_INFO("xanchor-host: Initializing...");

        if (!LoadProvider()) {
            LOG_ERROR("Failed to load an anchor provider");
            return false;
        }

        subsystem_ = std::make_unique<host::ProviderSubsystem>(provider_);
        controller_ = std::make_unique<core::AnchorInteractionController>(subsystem_.get(), subsystem_.get(),
                                                                          &scene_, config_.controller);

        // Anchor features stay off when the provider cannot track; the host keeps running
        XrResult result = controller_->Initialize();
        if (XR_FAILED(result)) {
            LOG_ERROR((std::string("Anchor controller not enabled: ") + ResultToString(result)).c_str());
        }

        LOG_INFO("xanchor-host: Initialized successfully");
        return true;
    }

    void Run() {
        const auto frame_period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(1.0 / config_.tick_hz));
        const auto start = std::chrono::steady_clock::now();
        auto next_frame = start;

        while (!g_stop_requested.load()) {
            auto now = std::chrono::steady_clock::now();
            if (config_.run_seconds > 0.0 && now - start >= std::chrono::duration<double>(config_.run_seconds)) {
                break;
            }

            auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch());

            // Provider events first, then the controller; gesture sampling is the last step of Tick()
            subsystem_->Update(ns.count());
            controller_->Tick();

            next_frame += frame_period;
            if (next_frame < now) {
                next_frame = now;
            }
            std::this_thread::sleep_until(next_frame);
        }

        LOG_INFO("xanchor-host: Frame loop stopped");
    }

    void Shutdown() {
        if (controller_) {
            controller_->Teardown();
            controller_.reset();
        }
        subsystem_.reset();
        provider_.Unload();
    }

   private:
    bool LoadProvider() {
        fs::path providers_dir;
        if (!config_.providers_dir.empty()) {
            providers_dir = fs::path(config_.providers_dir);
        } else {
            providers_dir = ExecutableDirectory() / "providers";
        }

        std::error_code ec;
        if (!fs::is_directory(providers_dir, ec)) {
            LOG_ERROR(("Providers folder not found: " + providers_dir.string()).c_str());
            return false;
        }

        LOG_INFO(("Scanning for providers in: " + providers_dir.string()).c_str());

        // First provider that can track wins
        for (const auto& entry : fs::directory_iterator(providers_dir, ec)) {
            if (!entry.is_directory()) continue;

            fs::path provider_path = entry.path();
            LOG_INFO(("Checking provider: " + provider_path.filename().string()).c_str());

            if (!provider_.LoadProvider(provider_path.string())) {
                continue;
            }

            if (provider_.IsTrackingAvailable()) {
                XaProviderInfo info = {};
                provider_.GetProviderInfo(&info);
                LOG_INFO(("Loaded provider: " + std::string(info.name)).c_str());
                return true;
            }

            LOG_INFO("Provider loaded but tracking not available");
            provider_.Unload();
        }

        if (ec) {
            LOG_ERROR(("Failed to scan providers folder: " + ec.message()).c_str());
        }
        LOG_ERROR("No provider with spatial tracking found");
        return false;
    }

    static fs::path ExecutableDirectory() {
        fs::path exe_path;
#ifdef _WIN32
        char path[MAX_PATH];
        GetModuleFileNameA(NULL, path, MAX_PATH);
        exe_path = fs::path(path);
#else
        char path[PATH_MAX];
        ssize_t len = readlink("/proc/self/exe", path, sizeof(path) - 1);
        if (len != -1) {
            path[len] = '\0';
            exe_path = fs::path(path);
        }
#endif
        return exe_path.parent_path();
    }

    host::HostConfig config_;
    host::ProviderLoader provider_;
    LoggingSceneHost scene_;
    std::unique_ptr<host::ProviderSubsystem> subsystem_;
    std::unique_ptr<core::AnchorInteractionController> controller_;
};

int main(int argc, char** argv) {
    host::HostConfig config = host::LoadHostConfig();
    SetLogLevel(config.log_level);

    LOG_INFO("=== xanchor-host starting ===");

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    AnchorHost anchor_host(config);

    if (!anchor_host.Initialize()) {
        LOG_ERROR("Failed to initialize host");
        anchor_host.Shutdown();
        return 1;
    }

    anchor_host.Run();
    anchor_host.Shutdown();

    LOG_INFO("=== xanchor-host stopped ===");
    return 0;
}
