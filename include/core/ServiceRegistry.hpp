/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SERVICE_REGISTRY_HPP
#define SERVICE_REGISTRY_HPP

/**
 * @file ServiceRegistry.hpp
 * @brief Typed lookup of services published by modules
 *
 * The ServiceRegistry provides:
 * - One instance per service type, keyed by std::type_index
 * - Ownership tracking so a failed module's services can be withdrawn
 * - Thread-safe lookup from host threads and tick threads
 *
 * Ownership: AppContext owns the registry; services are shared with callers.
 *
 * Usage:
 * @code
 * void MetabolismModule::onSetup(AppContext& ctx) {
 *     ctx.getServices().add<MetabolismService>(getId(), m_service);
 * }
 *
 * auto metabolism = ctx.getServices().get<MetabolismService>();
 * if (metabolism) { metabolism->getStats(playerId); }
 * @endcode
 */

#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace Lifeline {

class ServiceRegistry {
public:
    ServiceRegistry() = default;
    ~ServiceRegistry() = default;

    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;

    /**
     * @brief Publish a service of type T
     * @param ownerId Module that published it
     * @return false if a service of type T is already registered
     */
    template<typename T>
    bool add(const std::string& ownerId, std::shared_ptr<T> service)
    {
        if (!service) {
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        auto [it, inserted] = m_services.try_emplace(
            std::type_index(typeid(T)),
            Entry{ownerId, std::static_pointer_cast<void>(std::move(service))});
        (void)it;
        return inserted;
    }

    /**
     * @brief Look up the service of type T
     * @return nullptr if nothing of that type is registered
     */
    template<typename T>
    std::shared_ptr<T> get() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_services.find(std::type_index(typeid(T)));
        if (it == m_services.end()) {
            return nullptr;
        }
        return std::static_pointer_cast<T>(it->second.instance);
    }

    template<typename T>
    [[nodiscard]] bool has() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_services.find(std::type_index(typeid(T))) != m_services.end();
    }

    template<typename T>
    bool remove()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_services.erase(std::type_index(typeid(T))) > 0;
    }

    /**
     * @brief Withdraw every service published by a module
     * @return number of services removed
     */
    size_t removeOwnedBy(const std::string& ownerId)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t removed = 0;
        for (auto it = m_services.begin(); it != m_services.end();) {
            if (it->second.ownerId == ownerId) {
                it = m_services.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_services.size();
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_services.clear();
    }

private:
    struct Entry {
        std::string ownerId;
        std::shared_ptr<void> instance;
    };

    mutable std::mutex m_mutex;
    std::unordered_map<std::type_index, Entry> m_services;
};

} // namespace Lifeline

#endif // SERVICE_REGISTRY_HPP
