#pragma once

#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <functional>
#include "vellum/types.hpp"

namespace vellum::engine {

    /**
     * @brief Bijection between internal ids and external keys.
     * Both directions are updated together; neither side may repeat.
     */
    class IdMap {
    public:
        /**
         * @return false (and no change) if either the id or the key is already mapped.
         */
        bool insert(InternalId id, const std::string& key);

        /**
         * @return false if the id was not mapped.
         */
        bool erase(InternalId id);

        std::optional<std::string> key_of(InternalId id) const;
        std::optional<InternalId> id_of(const std::string& key) const;

        bool contains_key(const std::string& key) const { return m_reverse.count(key) > 0; }
        bool contains_id(InternalId id) const { return m_forward.count(id) > 0; }

        size_t size() const { return m_forward.size(); }
        bool empty() const { return m_forward.empty(); }
        void clear();

        InternalId max_id() const;

        /**
         * @brief Visits entries in ascending id order.
         */
        void for_each(const std::function<void(InternalId, const std::string&)>& callback) const;

        std::vector<std::string> keys() const;

    private:
        std::unordered_map<InternalId, std::string> m_forward;
        std::unordered_map<std::string, InternalId> m_reverse;
    };

}
