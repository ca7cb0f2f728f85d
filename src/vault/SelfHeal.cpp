#include "vault/SelfHeal.hpp"
#include "link/LinkManager.hpp"
#include "types/Error.hpp"
#include "log/Registry.hpp"

using namespace dredge;
using namespace dredge::vault;
using namespace dredge::log;

SelfHeal::Report SelfHeal::run() const {
    Report report;

    for (const auto& id : links_.orphanedLinkIds()) {
        try {
            links_.unlink(id, std::nullopt);
        } catch (const Error& e) {
            // Expected for orphans whose symlink is already gone
            Registry::vault()->debug("[SelfHeal] Unlink of orphan {}: {}", id, e.what());
        }
        if (!links_.isLinked(id)) {
            report.unlinked.push_back(id);
            Registry::vault()->info("[SelfHeal] Removed orphaned link {}", id);
        }
    }

    for (const auto& id : links_.orphanedSpawnedFiles()) {
        try {
            links_.removeSpawnedFile(id);
            report.removedSpawned.push_back(id);
            Registry::vault()->info("[SelfHeal] Removed orphaned spawned file {}", id);
        } catch (const Error& e) {
            Registry::vault()->warn("[SelfHeal] Failed to remove orphaned spawned file {}: {}", id, e.what());
        }
    }

    return report;
}
