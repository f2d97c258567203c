#pragma once
#include "general/address.hpp"
#include "general/serializer.hxx"
#include <string>

namespace nft {
struct TokenRecord {
    Address owner;
    Address approvedDelegate { Address::null() };
    std::string metadataURI;

    // null delegates never authorize anything
    [[nodiscard]] bool is_delegate(const Address& a) const
    {
        return !approvedDelegate.is_null() && approvedDelegate == a;
    }

    void serialize(Serializer auto& s) const
    {
        s << owner << approvedDelegate << SizedString { metadataURI };
    }
};

struct CollectionInfo {
    std::string name;
    std::string symbol;
};
}
