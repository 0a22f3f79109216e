#pragma once

namespace tickwell {

/// Participant in SaveStore::saveAll() / loadAll()
class ISaveable {
public:
    virtual ~ISaveable() = default;

    /// Restore state from the store
    virtual void load() = 0;

    /// Persist current state to the store
    virtual void save() = 0;
};

} // namespace tickwell
