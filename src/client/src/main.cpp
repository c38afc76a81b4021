// TankSync Replay - Main Entry Point
// [SYNC_AGENT] Drives the sync core against a scripted server without a network

#include "sync/EntityRegistry.hpp"
#include "sync/PhysicsBody.hpp"
#include "Constants.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <deque>
#include <iostream>
#include <random>
#include <string>
#include <utility>
#include <vector>

using namespace TankSync;

namespace {

struct ReplayOptions {
    uint32_t rttMs{80};
    uint32_t ticks{600};           // 10 s at 60 Hz
    float packetLoss{0.05f};
    uint32_t seed{1337};
    uint32_t readyAfterTicks{5};   // Renderer resources come up late
};

// Local tank body: integrates its own velocity and drifts off the server path
class ToyPhysicsBody : public PhysicsBody {
public:
    EntityPose pose() const override { return pose_; }

    void setTransform(const glm::vec3& position, float yaw) override {
        pose_.position = position;
        pose_.yaw = yaw;
    }

    void setTurret(float turretYaw, float aimPitch) override {
        pose_.turretYaw = turretYaw;
        pose_.aimPitch = aimPitch;
    }

    void setMotionType(MotionType type) override {
        motionType_ = type;
        if (type == MotionType::Kinematic) {
            kinematicSwitches_++;
        }
    }

    void setLinearVelocity(const glm::vec3& velocity) override { linearVelocity_ = velocity; }
    void setAngularVelocity(const glm::vec3& velocity) override { angularVelocity_ = velocity; }
    void computeWorldMatrix() override { worldMatrixUpdates_++; }

    void drive(const glm::vec3& velocity) { linearVelocity_ = velocity; }

    void bump(const glm::vec3& offset) { pose_.position += offset; }

    void step(float dtSeconds) {
        if (motionType_ != MotionType::Dynamic) {
            return;
        }
        // Slight overshoot, the kind of error a local simulation accumulates
        pose_.position += linearVelocity_ * (1.03f * dtSeconds);
        pose_.yaw = normalizeAngle(pose_.yaw + angularVelocity_.y * dtSeconds);
    }

    [[nodiscard]] uint32_t kinematicSwitches() const { return kinematicSwitches_; }
    [[nodiscard]] uint32_t worldMatrixUpdates() const { return worldMatrixUpdates_; }

private:
    EntityPose pose_;
    MotionType motionType_{MotionType::Dynamic};
    glm::vec3 linearVelocity_{0.0f};
    glm::vec3 angularVelocity_{0.0f};
    uint32_t kinematicSwitches_{0};
    uint32_t worldMatrixUpdates_{0};
};

// Authoritative world, advanced at server tick rate
class ScriptedServer {
public:
    static constexpr uint32_t REMOTE_TANKS = 4;

    explicit ScriptedServer(const NetEntityId& localId) : localId_(localId) {
        for (uint32_t i = 0; i < REMOTE_TANKS; ++i) {
            remoteIds_.push_back("tank-" + std::to_string(i + 1));
        }
    }

    [[nodiscard]] const std::vector<NetEntityId>& remoteIds() const { return remoteIds_; }

    // Remote tanks drive circles of different radii
    [[nodiscard]] PlayerStateSnapshot remoteState(uint32_t index, float timeSeconds) const {
        float radius = 10.0f + 5.0f * static_cast<float>(index);
        float speed = 0.4f + 0.1f * static_cast<float>(index);
        float angle = timeSeconds * speed + static_cast<float>(index);

        PlayerStateSnapshot state;
        state.id = remoteIds_[index];
        state.position = glm::vec3(radius * std::cos(angle), 0.5f, radius * std::sin(angle));
        state.rotation = normalizeAngle(angle + PI * 0.5f);
        state.turretRotation = normalizeAngle(timeSeconds * 0.8f);
        state.aimPitch = 0.05f * std::sin(timeSeconds);
        state.health = 100.0f;
        state.maxHealth = 100.0f;
        state.status = isDead(index, timeSeconds) ? EntityStatus::Dead : EntityStatus::Alive;
        return state;
    }

    // Local tank drives a straight line along +x
    [[nodiscard]] PlayerStateSnapshot localState(float timeSeconds) const {
        PlayerStateSnapshot state;
        state.id = localId_;
        state.position = localPosition(timeSeconds);
        state.health = 100.0f;
        state.maxHealth = 100.0f;
        return state;
    }

    [[nodiscard]] glm::vec3 localPosition(float timeSeconds) const {
        return glm::vec3(LOCAL_SPEED * timeSeconds, 0.5f, 0.0f);
    }

    [[nodiscard]] glm::vec3 localVelocity() const { return glm::vec3(LOCAL_SPEED, 0.0f, 0.0f); }

    // Tank 2 is destroyed for two seconds mid-match
    [[nodiscard]] static bool isDead(uint32_t index, float timeSeconds) {
        return index == 1 && timeSeconds >= 4.0f && timeSeconds < 6.0f;
    }

private:
    static constexpr float LOCAL_SPEED = 5.0f;

    NetEntityId localId_;
    std::vector<NetEntityId> remoteIds_;
};

// Messages in flight from server to client
struct InFlight {
    TimestampMs deliverAt;
    SyncMessage message;
};

void printUsage(const char* programName) {
    std::cout << "TankSync Replay v" << Constants::VERSION << "\n"
              << "Usage: " << programName << " [options]\n"
              << "\nOptions:\n"
              << "  --rtt <ms>              Simulated round trip time (default: 80)\n"
              << "  --ticks <num>           Render ticks to simulate (default: 600)\n"
              << "  --ignore-band <units>   Reconciliation ignore band (default: 0.15)\n"
              << "  --hard-threshold <u>    Hard correction threshold (default: 2.0)\n"
              << "  --soft-factor <f>       Soft correction blend factor (default: 0.3)\n"
              << "  --loss <fraction>       Snapshot loss probability (default: 0.05)\n"
              << "  --seed <num>            Random seed (default: 1337)\n"
              << "  --launch-delay <ms>     Projectile visibility delay (default: 0)\n"
              << "  --help, -h              Show this help\n";
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        ReplayOptions options;
        SyncConfig config;
        config.registry.localEntityId = "local";

        // Parse command line arguments
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--rtt" && i + 1 < argc) {
                options.rttMs = static_cast<uint32_t>(std::atoi(argv[++i]));
            } else if (arg == "--ticks" && i + 1 < argc) {
                options.ticks = static_cast<uint32_t>(std::atoi(argv[++i]));
            } else if (arg == "--ignore-band" && i + 1 < argc) {
                config.reconciliation.ignoreBand = std::strtof(argv[++i], nullptr);
            } else if (arg == "--hard-threshold" && i + 1 < argc) {
                config.reconciliation.hardThreshold = std::strtof(argv[++i], nullptr);
            } else if (arg == "--soft-factor" && i + 1 < argc) {
                config.reconciliation.softFactor = std::strtof(argv[++i], nullptr);
            } else if (arg == "--loss" && i + 1 < argc) {
                options.packetLoss = std::strtof(argv[++i], nullptr);
            } else if (arg == "--seed" && i + 1 < argc) {
                options.seed = static_cast<uint32_t>(std::atoi(argv[++i]));
            } else if (arg == "--launch-delay" && i + 1 < argc) {
                config.projectiles.launchDelayMs = static_cast<uint32_t>(std::atoi(argv[++i]));
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }

        std::string error;
        if (!config.validate(error)) {
            std::cerr << "Invalid configuration: " << error << "\n";
            return 1;
        }

        std::cout << "TankSync Replay v" << Constants::VERSION << "\n";
        std::cout << "RTT: " << options.rttMs << " ms\n";
        std::cout << "Ticks: " << options.ticks << "\n";
        std::cout << "Loss: " << options.packetLoss << "\n";
        std::cout << "Correction bands: ignore <= " << config.reconciliation.ignoreBand
                  << ", hard > " << config.reconciliation.hardThreshold
                  << ", soft factor " << config.reconciliation.softFactor << "\n\n";

        EntityRegistry registry(config);
        ScriptedServer server(config.registry.localEntityId);
        ToyPhysicsBody localBody;

        std::mt19937 rng(options.seed);
        std::uniform_real_distribution<float> chance(0.0f, 1.0f);
        std::uniform_int_distribution<uint32_t> jitter(0, 10);

        std::deque<InFlight> inFlight;
        auto send = [&](TimestampMs sentAt, SyncMessage message, bool lossy) {
            if (lossy && chance(rng) < options.packetLoss) {
                return;
            }
            TimestampMs deliverAt = sentAt + options.rttMs / 2 + jitter(rng);
            // Ordered channel: never overtake an earlier message
            if (!inFlight.empty()) {
                deliverAt = std::max(deliverAt, inFlight.back().deliverAt);
            }
            inFlight.push_back(InFlight{deliverAt, std::move(message)});
        };

        const float dt = Constants::RENDER_DT_SECONDS;
        const uint32_t ticksPerSnapshot = Constants::RENDER_RATE_HZ / Constants::SERVER_SNAPSHOT_RATE_HZ;
        uint32_t snapshotCount = 0;
        uint32_t projectileCount = 0;
        size_t projectilesRemoved = 0;
        std::vector<std::pair<NetEntityId, uint32_t>> liveShots;  // id, hit tick

        for (uint32_t tick = 0; tick < options.ticks; ++tick) {
            TimestampMs now = static_cast<TimestampMs>(tick * 1000 / Constants::RENDER_RATE_HZ);
            float timeSeconds = static_cast<float>(now) / 1000.0f;

            // ================================================================
            // SERVER SIDE
            // ================================================================

            if (tick % ticksPerSnapshot == 0) {
                std::vector<PlayerStateSnapshot> players;
                players.push_back(server.localState(timeSeconds));
                for (uint32_t i = 0; i < ScriptedServer::REMOTE_TANKS; ++i) {
                    // Tank 4 leaves after seven seconds
                    if (i == 3 && timeSeconds >= 7.0f) {
                        continue;
                    }
                    players.push_back(server.remoteState(i, timeSeconds));
                }
                bool fullRoster = (snapshotCount % 20) == 0;
                send(now, makePlayerStates(std::move(players), fullRoster, 0), true);
                snapshotCount++;
            }

            if (tick % (ticksPerSnapshot * 2) == 0) {
                EntityPose serverPose;
                serverPose.position = server.localPosition(timeSeconds);
                float diff = glm::distance(serverPose.position, localBody.pose().position);
                send(now, makeReconciliation(serverPose, diff, 0), true);
            }

            if (tick == 420) {
                send(now, makeEntityLeft(server.remoteIds()[3], 0), false);
            }

            // Remote tanks fire every 1.5 s; shots hit one second later
            if (tick % 90 == 45) {
                uint32_t shooter = (tick / 90) % ScriptedServer::REMOTE_TANKS;
                PlayerStateSnapshot state = server.remoteState(shooter, timeSeconds);
                ProjectileSpawnMessage spawn;
                spawn.id = "shell-" + std::to_string(++projectileCount);
                spawn.ownerId = state.id;
                spawn.position = *state.position + glm::vec3(0.0f, 1.5f, 0.0f);
                spawn.direction = glm::vec3(std::cos(state.rotation), 0.0f, std::sin(state.rotation));
                send(now, makeProjectileSpawn(spawn, 0), false);
                liveShots.emplace_back(spawn.id, tick + 60);
            }

            for (auto it = liveShots.begin(); it != liveShots.end();) {
                if (tick >= it->second) {
                    send(now, makeProjectileHit(it->first, "", 0), false);
                    it = liveShots.erase(it);
                } else {
                    ++it;
                }
            }

            // ================================================================
            // CLIENT SIDE
            // ================================================================

            while (!inFlight.empty() && inFlight.front().deliverAt <= now) {
                SyncMessage message = std::move(inFlight.front().message);
                message.receivedAt = now;
                inFlight.pop_front();
                registry.onMessage(message);
            }

            if (tick == options.readyAfterTicks) {
                registry.markRendererReady();
            }

            // Physics step for the local tank, reconciled in-step
            localBody.drive(server.localVelocity());
            if (tick == 300) {
                localBody.bump(glm::vec3(0.0f, 0.0f, 4.0f));  // Simulated collision glitch
            }
            localBody.step(dt);
            CorrectionResult correction = registry.applyLocalCorrection(localBody);
            if (correction.tier == CorrectionTier::Hard) {
                std::cout << "[REPLAY] Hard correction at " << now << " ms (diff "
                          << correction.positionDiff << ")\n";
            }

            registry.update(now, dt, options.rttMs);
            projectilesRemoved += registry.projectiles().consumeRemovedProjectiles().size();

            if (tick % Constants::RENDER_RATE_HZ == 0) {
                std::cout << "[REPLAY] t=" << now << "ms remote=" << registry.remoteCount()
                          << " pending=" << registry.pendingCount()
                          << " projectiles=" << registry.projectiles().count()
                          << " quality=" << registry.metrics().getSyncQuality() << "\n";
            }
        }

        const RegistryStats& stats = registry.getStats();
        std::cout << "\n[REPLAY] Done\n";
        std::cout << "  Messages handled: " << stats.messagesHandled << "\n";
        std::cout << "  Snapshots applied: " << stats.snapshotsApplied
                  << ", rejected: " << stats.snapshotsRejected
                  << ", dropped: " << stats.snapshotsDropped << "\n";
        std::cout << "  Entities created: " << stats.entitiesCreated
                  << ", removed: " << stats.entitiesRemoved
                  << ", pruned: " << stats.entitiesPruned << "\n";
        std::cout << "  Projectiles fired: " << projectileCount
                  << ", removed: " << projectilesRemoved << "\n";
        std::cout << "  Kinematic switches: " << localBody.kinematicSwitches() << "\n";

        registry.metrics().generateReport();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nFatal error: " << e.what() << "\n";
        return 1;
    }
}
