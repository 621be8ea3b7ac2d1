#ifndef DOCSANITIZER_STORE_OBJECT_STORE_HPP
#define DOCSANITIZER_STORE_OBJECT_STORE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "core/media_kind.hpp"

/**
 * @file object_store.hpp
 * @brief Ephemeral in-memory store for uploaded documents.
 *
 * DESIGN GOALS:
 *   1. Uploads land here via put() and get an opaque UUID; the control path
 *      later reads them by that id.
 *   2. Every object expires ttl after creation. get() checks expiry on each
 *      read, so expired bytes are never handed out even if the sweep is late.
 *   3. A background thread (startReclamation) sweeps expired entries every
 *      sweepInterval purely to free memory.
 *   4. Objects are write-once and shared as shared_ptr<const StoredObject>, so
 *      a reader keeps its copy alive even if the entry is swept right after.
 *   5. One shared_mutex: insert/remove/take/sweep are exclusive, reads shared.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace docsanitizer::store;
 *   ObjectStore store(std::chrono::minutes(5), std::chrono::seconds(30));
 *   store.startReclamation();
 *
 *   std::string id = store.put(bytes, core::MediaKind::Pdf, "report.pdf");
 *   auto object = store.get(id);   // throws ObjectNotFoundError once expired
 *   store.remove(id);
 *   @endcode
 */

namespace docsanitizer {
namespace store {

/**
 * @struct StoredObject
 * @brief One uploaded payload. Never mutated after put().
 */
struct StoredObject
{
    using Clock = std::chrono::system_clock;

    std::string id;
    std::vector<uint8_t> bytes;
    core::MediaKind mediaKind;
    std::string originalName;
    Clock::time_point createdAt;
    Clock::time_point expiresAt;
};

/**
 * @brief Thrown by get()/take() for ids that are unknown, reclaimed or expired.
 *        Callers see a single error class for all three.
 */
class ObjectNotFoundError : public std::runtime_error
{
public:
    ObjectNotFoundError(const std::string &id, const std::string &detail)
        : std::runtime_error("ObjectStore: object not found: " + id + " (" + detail + ")")
        , id_(id)
    {
    }

    const std::string &id() const { return id_; }

private:
    std::string id_;
};

/**
 * @struct StoreStats
 * @brief Monotonic counters, for observability and tests.
 */
struct StoreStats
{
    uint64_t puts = 0;
    uint64_t reads = 0;     ///< get() and take() calls, hits and misses alike
    uint64_t misses = 0;    ///< reads that raised ObjectNotFoundError
    uint64_t removals = 0;  ///< explicit remove()/take() that found the object
    uint64_t evictions = 0; ///< entries reclaimed by sweepExpired()
};

class ObjectStore
{
public:
    using Clock = StoredObject::Clock;
    using ClockFn = std::function<Clock::time_point()>;
    using IdGenerator = std::function<std::string()>;

    /**
     * @param ttl Lifetime of each object.
     * @param sweepInterval Period of the background sweep.
     * @param maxObjectBytes Largest accepted payload; 0 disables the check.
     * @param clock Time source, injectable for tests. Defaults to system_clock::now.
     * @throw std::invalid_argument if ttl or sweepInterval is not positive.
     */
    ObjectStore(std::chrono::milliseconds ttl,
                std::chrono::milliseconds sweepInterval,
                uint64_t maxObjectBytes = 0,
                ClockFn clock = ClockFn());

    ~ObjectStore();

    ObjectStore(const ObjectStore &) = delete;
    ObjectStore &operator=(const ObjectStore &) = delete;

    /**
     * @brief Store a payload and return its fresh identifier.
     * @throw std::invalid_argument if the payload exceeds maxObjectBytes.
     */
    std::string put(std::vector<uint8_t> bytes, core::MediaKind mediaKind, const std::string &originalName = "");

    /**
     * @brief Fetch a live object.
     * @throw ObjectNotFoundError if unknown, reclaimed or expired.
     */
    std::shared_ptr<const StoredObject> get(const std::string &id) const;

    /**
     * @brief Remove an object early.
     * @return false if it was not present (never existed, expired-and-swept, or already removed).
     */
    bool remove(const std::string &id);

    /**
     * @brief Atomic read-then-delete. Races with the sweep resolve to exactly
     *        one winner: either take() returns the object or it throws.
     * @throw ObjectNotFoundError as get().
     */
    std::shared_ptr<const StoredObject> take(const std::string &id);

    /**
     * @brief Drop every entry whose expiry has passed.
     * @return Number of entries removed.
     */
    size_t sweepExpired();

    /**
     * @brief True if the id is present and not expired.
     */
    bool contains(const std::string &id) const;

    /// Entries physically held, expired-but-unswept included.
    size_t size() const;

    StoreStats stats() const;

    /// Start the background reclamation thread. No-op if already running.
    /// Safe to race with stopReclamation from other threads.
    void startReclamation();

    /// Stop and join the reclamation thread. No-op if not running.
    void stopReclamation();

    bool isReclaiming() const { return reclaiming_.load(); }

    std::chrono::milliseconds ttl() const { return ttl_; }

    /// Replace the id generator. Only meant for collision tests.
    void setIdGenerator(IdGenerator generator);

private:
    void reclamationLoop();
    Clock::time_point now() const;

    std::chrono::milliseconds ttl_;
    std::chrono::milliseconds sweepInterval_;
    uint64_t maxObjectBytes_;
    ClockFn clock_;
    IdGenerator idGenerator_;

    mutable std::shared_mutex mapMutex_;
    std::unordered_map<std::string, std::shared_ptr<const StoredObject>> objects_;

    mutable std::atomic<uint64_t> puts_{0};
    mutable std::atomic<uint64_t> reads_{0};
    mutable std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> removals_{0};
    std::atomic<uint64_t> evictions_{0};

    std::atomic<bool> reclaiming_{false};
    std::mutex lifecycleMutex_; // serialises start/stop, taken before reclamationMutex_
    std::thread reclamationThread_;
    std::mutex reclamationMutex_;
    std::condition_variable reclamationCv_;
};

} // namespace store
} // namespace docsanitizer

#endif // DOCSANITIZER_STORE_OBJECT_STORE_HPP
