// task/init_task.cpp
#include "task/init_task.hpp"
#include "task/runtime.hpp"
#include "config/config_loader.hpp"
#include "pipeline/detail_fanout.hpp"
#include "util/log.hpp"

#include <cstdlib>
#include <string>
#include <vector>

namespace rev::task {

static pipeline::PumpOptions readPumpOptions(const config::ConfigLoader& cfg,
                                             const std::string& prefix,
                                             pipeline::PumpOptions def)
{
    auto read = [&](const char* key, std::size_t fallback) {
        int v = cfg.GetInt("pipeline", prefix + key, static_cast<int>(fallback));
        return v > 0 ? static_cast<std::size_t>(v) : fallback;
    };
    def.low_water        = read("low_water", def.low_water);
    def.hard_cap         = read("hard_cap", def.hard_cap);
    def.channel_capacity = read("channel_capacity", def.channel_capacity);
    return def;
}

bool Init()
{
    auto& cfg = config::ConfigLoader::getInstance();

    // Config search: $REV_CONFIG_HOME, then ./conf, then ../conf for build dirs.
    std::vector<std::string> candidates;
    if (const char* home = std::getenv("REV_CONFIG_HOME"))
        candidates.push_back(std::string(home) + "/config.ini");
    candidates.push_back("conf/config.ini");
    candidates.push_back("../conf/config.ini");
    std::string loaded = cfg.LoadFirst(candidates);

    auto& logger = util::Logger::getInstance();
    logger.setLevel(util::ParseLogLevel(cfg.Get("log", "level", "info")));
    logger.open(cfg.Get("log", "file", "rev.log"));

    util::LogInfo("Init", "Starting init...");
    if (loaded.empty())
        util::LogWarn("Init", "Config not found (REV_CONFIG_HOME, conf/config.ini, ../conf/config.ini); using defaults");
    else
        util::LogInfo("Init", "Config loaded from {}", loaded);
    for (const auto& [section, entries] : cfg.DebugAll())
        for (const auto& [key, value] : entries)
            if (key != "token") util::LogDebug("Init", "[{}] {}={}", section, key, value);

    auto& rt = Runtime::getInstance();

    auto backend = cfg.Get("github", "backend", "github");
    auto source  = source::IReviewSource::create(backend);
    if (!source.ok()) {
        util::LogError("Init", "Review source could not be created ({}): {}", backend,
                       source.status().ToString());
        return false;
    }
    rt.source = *std::move(source);

    if (auto requested = cfg.Get("browse", "requested", ""); !requested.empty())
        rt.filter.requested = requested;
    if (auto org = cfg.Get("browse", "org", ""); !org.empty())
        rt.filter.org = org;
    rt.filter.labels = cfg.GetList("browse", "labels");

    rt.summary_options = readPumpOptions(cfg, "", pipeline::PumpOptions{});
    rt.detail_options  = readPumpOptions(cfg, "detail_", pipeline::DetailFanout::DefaultOptions());

    rt.app_options.tick_ms = cfg.GetInt("ui", "tick_ms", rt.app_options.tick_ms);
    rt.circular = cfg.GetBool("ui", "circular", true);
    rt.truncate = cfg.GetBool("ui", "truncate", true);

    util::LogInfo("Init", "backend={} requested={} org={} labels={} cap={}",
                  backend, rt.filter.requested.value_or("@me"), rt.filter.org.value_or("-"),
                  rt.filter.labels.size(), rt.summary_options.hard_cap);
    return true;
}

} // namespace rev::task
