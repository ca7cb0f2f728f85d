#pragma once

#include <string>
#include <vector>

namespace dredge::link {
class LinkManager;
}

namespace dredge::vault {

// Drops manifest entries whose item is gone and spawned files no entry refers to.
// Running it twice in a row changes nothing the second time.
class SelfHeal {
public:
    struct Report {
        std::vector<std::string> unlinked;
        std::vector<std::string> removedSpawned;

        [[nodiscard]] bool empty() const { return unlinked.empty() && removedSpawned.empty(); }
    };

    explicit SelfHeal(link::LinkManager& links) : links_(links) {}

    Report run() const;

private:
    link::LinkManager& links_;
};

}
