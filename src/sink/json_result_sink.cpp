#include "json_result_sink.hpp"
#include <ctime>
#include <filesystem>
#include <fstream>
#include "../core/logger/logger.hpp"

namespace Gleaner {
namespace Sink {

using Core::Logger;
using nlohmann::ordered_json;

namespace {

std::string iso_time(const Engine::Job::TimePoint& tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm     tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

ordered_json optional_time(const std::optional<Engine::Job::TimePoint>& tp) {
    if (!tp)
        return nullptr;
    return iso_time(*tp);
}

}  // namespace

ordered_json to_json(const Engine::Job::PageResult& page) {
    ordered_json out;
    out["url"]         = page.url;
    out["seed"]        = page.seed;
    out["page"]        = page.page_number;
    out["success"]     = page.success;
    out["record"]      = page.record;
    out["coverage"]    = page.coverage;
    out["partial"]     = page.partial;
    out["next_url"]    = page.next_url.empty() ? ordered_json(nullptr) : ordered_json(page.next_url);
    out["status_code"] = page.status_code;
    out["latency_ms"]  = page.latency.count();
    out["proxy"]       = page.proxy.empty() ? ordered_json(nullptr) : ordered_json(page.proxy);
    out["attempts"]    = page.attempts;

    ordered_json field_errors = ordered_json::array();
    for (const auto& err : page.field_errors)
        field_errors.push_back(
            {{"field", err.field}, {"message", err.message}, {"required", err.required}});
    out["field_errors"] = field_errors;

    if (page.error)
        out["error"] = {{"kind", page.error->kind}, {"message", page.error->message}};
    else
        out["error"] = nullptr;
    return out;
}

ordered_json to_json(const Engine::Job::JobSnapshot& snapshot) {
    ordered_json out;
    out["id"]       = snapshot.id;
    out["name"]     = snapshot.name;
    out["url"]      = snapshot.target_url;
    out["template"] = snapshot.template_name;
    out["status"]   = Engine::Job::to_string(snapshot.progress.status);

    const auto& p = snapshot.progress;
    out["progress"] = {{"pages_fetched", p.pages_fetched},
                       {"items_extracted", p.items_extracted},
                       {"items_failed", p.items_failed},
                       {"estimated_total", p.estimated_total},
                       {"percent", p.percent ? ordered_json(*p.percent) : ordered_json(nullptr)}};

    out["created_at"] = iso_time(snapshot.created_at);
    out["started_at"] = optional_time(snapshot.started_at);
    out["ended_at"]   = optional_time(snapshot.ended_at);
    out["errors"]     = snapshot.errors;
    out["reason"]     = snapshot.terminal_reason;
    return out;
}

JsonResultSink::JsonResultSink(const std::string& base_path) : base_path_(base_path) {
    if (!base_path_.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(base_path_, ec);
        if (ec)
            Logger::error("Failed to create output directory " + base_path_ + ": " + ec.message());
    }
}

std::string JsonResultSink::path_for(const Engine::Job::JobId& id) const {
    std::filesystem::path path(base_path_);
    path /= id + ".json";
    return path.string();
}

void JsonResultSink::on_job_finished(const Engine::Job::JobSnapshot&             snapshot,
                                     const std::vector<Engine::Job::PageResult>& pages) {
    ordered_json doc;
    doc["job"] = to_json(snapshot);

    ordered_json items = ordered_json::array();
    ordered_json all   = ordered_json::array();
    for (const auto& page : pages) {
        all.push_back(to_json(page));
        if (page.success && !page.record.empty())
            items.push_back(page.record);
    }
    doc["records"] = items;
    doc["pages"]   = all;

    std::string   path = path_for(snapshot.id);
    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::error("Write Error: " + path);
        return;
    }
    file << doc.dump(2) << '\n';
    Logger::success("Saved: " + path);
}

}  // namespace Sink
}  // namespace Gleaner
