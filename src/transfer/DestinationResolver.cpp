#include "transfer/DestinationResolver.hpp"
#include "transfer/errors.hpp"

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <cctype>

using namespace sf::transfer;
using namespace sf::transfer::model;

DestinationResolver::DestinationResolver(std::string defaultSpec, std::string defaultFolder)
    : defaultSpec_(std::move(defaultSpec)), defaultFolder_(std::move(defaultFolder)) {}

Destination DestinationResolver::resolve(const std::string& spec) const {
    auto s = boost::algorithm::trim_copy(spec);
    if (s.empty()) s = boost::algorithm::trim_copy(defaultSpec_);
    if (s.empty()) throw ResolutionError("No destination given and no default destination configured");

    const auto colon = s.find(':');
    if (colon == std::string::npos) throw ResolutionError("Malformed destination: " + s);

    const auto scheme = boost::algorithm::to_lower_copy(s.substr(0, colon));
    auto target = boost::algorithm::trim_copy(s.substr(colon + 1));

    if (scheme == "chat") {
        const auto body = !target.empty() && target.front() == '-' ? target.substr(1) : target;
        const bool numeric = !body.empty() && std::ranges::all_of(body, [](const unsigned char c) { return std::isdigit(c) != 0; });
        const bool handle = target.size() > 1 && target.front() == '@';
        if (!numeric && !handle) throw ResolutionError("Invalid chat id: " + target);
        return {DestinationKind::Chat, target};
    }

    if (scheme == "drive") {
        if (target.empty()) target = defaultFolder_;
        if (target.find_first_of("/: ") != std::string::npos) throw ResolutionError("Invalid drive folder id: " + target);
        return {DestinationKind::Cloud, target};
    }

    if (scheme == "remote") {
        const auto sep = target.find(':');
        if (sep == std::string::npos || sep == 0) throw ResolutionError("Remote target must be <remote>:<path>: " + target);
        return {DestinationKind::RemoteSync, target};
    }

    throw ResolutionError("Unknown destination kind: " + scheme);
}
