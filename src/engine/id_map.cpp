#include "id_map.hpp"
#include <algorithm>

namespace vellum::engine {

    bool IdMap::insert(InternalId id, const std::string& key) {
        if (m_forward.count(id) || m_reverse.count(key)) return false;
        m_forward.emplace(id, key);
        m_reverse.emplace(key, id);
        return true;
    }

    bool IdMap::erase(InternalId id) {
        auto it = m_forward.find(id);
        if (it == m_forward.end()) return false;
        m_reverse.erase(it->second);
        m_forward.erase(it);
        return true;
    }

    std::optional<std::string> IdMap::key_of(InternalId id) const {
        auto it = m_forward.find(id);
        if (it == m_forward.end()) return std::nullopt;
        return it->second;
    }

    std::optional<InternalId> IdMap::id_of(const std::string& key) const {
        auto it = m_reverse.find(key);
        if (it == m_reverse.end()) return std::nullopt;
        return it->second;
    }

    void IdMap::clear() {
        m_forward.clear();
        m_reverse.clear();
    }

    InternalId IdMap::max_id() const {
        InternalId max = 0;
        for (const auto& entry : m_forward) max = std::max(max, entry.first);
        return max;
    }

    void IdMap::for_each(const std::function<void(InternalId, const std::string&)>& callback) const {
        std::vector<InternalId> ids;
        ids.reserve(m_forward.size());
        for (const auto& entry : m_forward) ids.push_back(entry.first);
        std::sort(ids.begin(), ids.end());
        for (InternalId id : ids) callback(id, m_forward.at(id));
    }

    std::vector<std::string> IdMap::keys() const {
        std::vector<std::string> out;
        out.reserve(m_reverse.size());
        for (const auto& entry : m_reverse) out.push_back(entry.first);
        std::sort(out.begin(), out.end());
        return out;
    }

}
