#include "store/object_store.hpp"

#include <exception>

#include "util/identifiers.hpp"
#include "util/logger.hpp"

namespace docsanitizer {
namespace store {

namespace logger = util::logger;

ObjectStore::ObjectStore(std::chrono::milliseconds ttl,
                         std::chrono::milliseconds sweepInterval,
                         uint64_t maxObjectBytes,
                         ClockFn clock)
    : ttl_(ttl)
    , sweepInterval_(sweepInterval)
    , maxObjectBytes_(maxObjectBytes)
    , clock_(std::move(clock))
    , idGenerator_(&util::identifiers::newObjectId)
{
    if (ttl_.count() <= 0) {
        throw std::invalid_argument("ObjectStore: ttl must be positive");
    }
    if (sweepInterval_.count() <= 0) {
        throw std::invalid_argument("ObjectStore: sweep interval must be positive");
    }
    if (!clock_) {
        clock_ = [] { return Clock::now(); };
    }
    logger::info("[ObjectStore] initialized (ttl " + std::to_string(ttl_.count()) + " ms, sweep every " +
                 std::to_string(sweepInterval_.count()) + " ms)");
}

ObjectStore::~ObjectStore()
{
    stopReclamation();
}

ObjectStore::Clock::time_point ObjectStore::now() const
{
    return clock_();
}

std::string ObjectStore::put(std::vector<uint8_t> bytes, core::MediaKind mediaKind, const std::string &originalName)
{
    if (maxObjectBytes_ > 0 && bytes.size() > maxObjectBytes_) {
        throw std::invalid_argument("ObjectStore: payload of " + std::to_string(bytes.size()) +
                                    " bytes exceeds the limit of " + std::to_string(maxObjectBytes_));
    }

    const size_t size = bytes.size();
    const std::string fingerprint = util::identifiers::fingerprint(bytes);

    auto object = std::make_shared<StoredObject>();
    object->bytes = std::move(bytes);
    object->mediaKind = mediaKind;
    object->originalName = originalName;

    std::string id;
    {
        std::unique_lock<std::shared_mutex> lock(mapMutex_);
        // A live id is never reused. With v4 UUIDs a retry is practically
        // unreachable, but the guarantee must not depend on luck.
        do {
            id = idGenerator_();
        } while (objects_.count(id) != 0);

        object->id = id;
        object->createdAt = now();
        object->expiresAt = object->createdAt + ttl_;
        objects_.emplace(id, std::move(object));
    }
    ++puts_;

    logger::info("[ObjectStore] stored " + id + " (" + core::mediaKindName(mediaKind) + ", " +
                 std::to_string(size) + " bytes, sha256 " + fingerprint + ")");
    return id;
}

std::shared_ptr<const StoredObject> ObjectStore::get(const std::string &id) const
{
    ++reads_;
    std::shared_lock<std::shared_mutex> lock(mapMutex_);
    auto it = objects_.find(id);
    if (it == objects_.end()) {
        ++misses_;
        throw ObjectNotFoundError(id, "unknown or reclaimed");
    }
    if (now() >= it->second->expiresAt) {
        ++misses_;
        throw ObjectNotFoundError(id, "expired");
    }
    return it->second;
}

bool ObjectStore::remove(const std::string &id)
{
    std::unique_lock<std::shared_mutex> lock(mapMutex_);
    auto it = objects_.find(id);
    if (it == objects_.end()) {
        return false;
    }
    objects_.erase(it);
    lock.unlock();

    ++removals_;
    logger::info("[ObjectStore] removed " + id);
    return true;
}

std::shared_ptr<const StoredObject> ObjectStore::take(const std::string &id)
{
    ++reads_;
    std::unique_lock<std::shared_mutex> lock(mapMutex_);
    auto it = objects_.find(id);
    if (it == objects_.end()) {
        ++misses_;
        throw ObjectNotFoundError(id, "unknown or reclaimed");
    }
    if (now() >= it->second->expiresAt) {
        // Expired: reclaim it here rather than leave it for the sweep.
        objects_.erase(it);
        ++evictions_;
        ++misses_;
        throw ObjectNotFoundError(id, "expired");
    }
    std::shared_ptr<const StoredObject> object = std::move(it->second);
    objects_.erase(it);
    lock.unlock();

    ++removals_;
    logger::info("[ObjectStore] took " + id);
    return object;
}

size_t ObjectStore::sweepExpired()
{
    size_t removed = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mapMutex_);
        const auto cutoff = now();
        for (auto it = objects_.begin(); it != objects_.end();) {
            if (cutoff >= it->second->expiresAt) {
                it = objects_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        evictions_ += removed;
        logger::info("[ObjectStore] sweep reclaimed " + std::to_string(removed) + " expired object(s)");
    }
    return removed;
}

bool ObjectStore::contains(const std::string &id) const
{
    std::shared_lock<std::shared_mutex> lock(mapMutex_);
    auto it = objects_.find(id);
    return it != objects_.end() && now() < it->second->expiresAt;
}

size_t ObjectStore::size() const
{
    std::shared_lock<std::shared_mutex> lock(mapMutex_);
    return objects_.size();
}

StoreStats ObjectStore::stats() const
{
    StoreStats s;
    s.puts = puts_.load();
    s.reads = reads_.load();
    s.misses = misses_.load();
    s.removals = removals_.load();
    s.evictions = evictions_.load();
    return s;
}

void ObjectStore::setIdGenerator(IdGenerator generator)
{
    std::unique_lock<std::shared_mutex> lock(mapMutex_);
    idGenerator_ = generator ? std::move(generator) : IdGenerator(&util::identifiers::newObjectId);
}

void ObjectStore::startReclamation()
{
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    std::lock_guard<std::mutex> lock(reclamationMutex_);
    if (reclaiming_) {
        logger::warn("[ObjectStore] startReclamation called but the sweep is already running.");
        return;
    }
    reclaiming_ = true;
    reclamationThread_ = std::thread(&ObjectStore::reclamationLoop, this);
    logger::info("[ObjectStore] reclamation thread started.");
}

void ObjectStore::stopReclamation()
{
    // Held through the join so a concurrent start cannot replace a joinable thread.
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    {
        std::lock_guard<std::mutex> lock(reclamationMutex_);
        if (!reclaiming_) {
            return;
        }
        reclaiming_ = false;
    }
    reclamationCv_.notify_all();
    if (reclamationThread_.joinable()) {
        reclamationThread_.join();
    }
    logger::info("[ObjectStore] reclamation thread stopped.");
}

void ObjectStore::reclamationLoop()
{
    std::unique_lock<std::mutex> lock(reclamationMutex_);
    while (reclaiming_) {
        auto nextWake = std::chrono::steady_clock::now() + sweepInterval_;
        reclamationCv_.wait_until(lock, nextWake, [this] { return !reclaiming_; });
        if (!reclaiming_) {
            break;
        }

        lock.unlock();
        try {
            sweepExpired();
        } catch (const std::exception &ex) {
            // The sweep never raises to callers; the next cycle retries.
            logger::error(std::string("[ObjectStore] sweep failed: ") + ex.what());
        }
        lock.lock();
    }
}

} // namespace store
} // namespace docsanitizer
