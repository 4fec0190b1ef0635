#pragma once

#include <filesystem>
#include <string>

namespace sf::auth::model {

enum class CredentialKind { Cookie, ServiceAccount };
enum class CredentialScope { User, Global, Pool };

struct Credential {
    CredentialKind kind{CredentialKind::Cookie};
    CredentialScope scope{CredentialScope::Global};
    std::filesystem::path path;
    std::string account;    // owner for user cookies, client_email / file stem for service accounts
};

std::string to_string(CredentialKind k);
std::string to_string(CredentialScope s);

}
