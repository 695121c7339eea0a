#pragma once
#include <map>
#include <string>
#include <vector>
namespace keyward::identity::models {
// Values handed to IIdentityStore::Create. Never carries a private key or a
// passphrase.
struct IdentityFields {
    std::string email;
    std::string public_key;
    std::vector<std::string> prompt_ids;
    // Extra registration data (display name and the like), passed through.
    std::map<std::string, std::string> attributes;
};
}
