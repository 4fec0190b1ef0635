#include "transfer/model/TaskSnapshot.hpp"
#include "util/humanize.hpp"

#include <nlohmann/json.hpp>
#include <fmt/format.h>

#include <stdexcept>

using namespace sf::transfer::model;

std::string sf::transfer::model::to_string(const SourceKind k) {
    switch (k) {
        case SourceKind::Torrent: return "torrent";
        case SourceKind::DirectHttp: return "direct_http";
        case SourceKind::Extractor: return "extractor";
        case SourceKind::CloudClone: return "cloud_clone";
        default: throw std::invalid_argument("Unknown source kind");
    }
}

std::string sf::transfer::model::to_string(const DestinationKind k) {
    switch (k) {
        case DestinationKind::Chat: return "chat";
        case DestinationKind::Cloud: return "cloud";
        case DestinationKind::RemoteSync: return "remote_sync";
        default: throw std::invalid_argument("Unknown destination kind");
    }
}

std::string sf::transfer::model::to_string(const ErrorKind k) {
    switch (k) {
        case ErrorKind::Transient: return "transient";
        case ErrorKind::Auth: return "auth";
        case ErrorKind::QuotaExceeded: return "quota_exceeded";
        case ErrorKind::Fatal: return "fatal";
        case ErrorKind::Unsupported: return "unsupported";
        case ErrorKind::CancelledByUser: return "cancelled_by_user";
        default: throw std::invalid_argument("Unknown error kind");
    }
}

void sf::transfer::model::to_json(nlohmann::json& j, const Progress& p) {
    j = {
        {"transferred", p.transferred},
        {"rate", p.rate}
    };
    j["total"] = p.total ? nlohmann::json(*p.total) : nlohmann::json(nullptr);
    j["eta_s"] = p.eta ? nlohmann::json(p.eta->count()) : nlohmann::json(nullptr);
    if (const auto pct = p.percent()) j["percent"] = *pct;
}

void sf::transfer::model::to_json(nlohmann::json& j, const ErrorInfo& e) {
    j = {
        {"kind", to_string(e.kind)},
        {"message", e.message}
    };
    if (!e.account.empty()) j["account"] = e.account;
    if (e.retryAfter.count() > 0) j["retry_after_s"] = e.retryAfter.count();
}

void sf::transfer::model::to_json(nlohmann::json& j, const TaskSnapshot& t) {
    const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t.created_at);
    j = {
        {"id", t.id},
        {"owner", t.owner},
        {"source", {{"kind", to_string(t.source.kind)}, {"reference", t.source.reference}}},
        {"destination", {{"kind", to_string(t.destination.kind)}, {"target", t.destination.target}}},
        {"state", to_string(t.state)},
        {"progress", t.progress},
        {"attempt", t.attempt},
        {"reason", t.reason},
        {"age_ms", age.count()},
        {"cancel_requested", t.cancel_requested}
    };
    if (t.error) j["error"] = *t.error;
}

std::string sf::transfer::model::to_string(const TaskSnapshot& t) {
    std::string out = fmt::format("{} [{}] {} -> {} ({})", t.id, to_string(t.state),
                                  to_string(t.source.kind), to_string(t.destination.kind), t.owner);

    if (t.progress.total)
        out += fmt::format(" {}/{}", util::readableSize(t.progress.transferred), util::readableSize(*t.progress.total));
    else if (t.progress.transferred > 0)
        out += fmt::format(" {}", util::readableSize(t.progress.transferred));

    if (t.progress.rate > 0) out += " @ " + util::readableRate(t.progress.rate);
    if (t.progress.eta) out += " eta " + util::readableTime(*t.progress.eta);
    if (t.attempt > 0) out += fmt::format(" attempt {}", t.attempt);
    if (!t.reason.empty()) out += " - " + t.reason;
    return out;
}
