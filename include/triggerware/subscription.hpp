#pragma once
#include "types.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace triggerware {

class TriggerwareClient;
class BatchSubscription;

/// Called once per row the server reports for a subscription.
using SubscriptionHandler = std::function<void(const nlohmann::json& tuple)>;

enum class SubscriptionState {
    Inactive,
    Active,
    BatchMember,
};

/// Interest in future changes matching a query. A subscription starts
/// inactive. It either receives notifications on its own (activate) or
/// through a BatchSubscription (add_to_batch), never both.
///
/// The handler runs on the connection's dispatch thread. The object itself
/// is not thread-safe.
class Subscription {
public:
    Subscription(TriggerwareClient& client, Query query, SubscriptionHandler on_notification);

    /// Stops local delivery and leaves any batch. Nothing is sent to the server.
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    /// Inactive -> Active. Throws SubscriptionError from any other state or
    /// when the server refuses.
    void activate();

    /// Active -> Inactive. Throws SubscriptionError from any other state.
    void deactivate();

    /// Inactive -> BatchMember. The batch must belong to the same client.
    void add_to_batch(BatchSubscription& batch);

    /// BatchMember -> Inactive.
    void remove_from_batch();

    [[nodiscard]] SubscriptionState state() const { return state_; }
    [[nodiscard]] bool active() const { return state_ == SubscriptionState::Active; }
    [[nodiscard]] bool part_of_batch() const { return state_ == SubscriptionState::BatchMember; }
    [[nodiscard]] BatchSubscription* batch() const { return batch_; }

    [[nodiscard]] const std::string& label() const { return label_; }
    [[nodiscard]] const Query& query() const { return query_; }
    [[nodiscard]] TriggerwareClient& client() const { return *client_; }

private:
    friend class BatchSubscription;

    nlohmann::json request(const std::string& method, bool combine) const;

    TriggerwareClient* client_;
    Query query_;
    SubscriptionHandler on_notification_;
    std::string label_;
    nlohmann::json base_parameters_;
    SubscriptionState state_{SubscriptionState::Inactive};
    BatchSubscription* batch_{nullptr};
};

/// A group of subscriptions whose changes the server reports together, in
/// one notification per transaction. Each match is routed to the member
/// subscription carrying its label.
class BatchSubscription {
public:
    explicit BatchSubscription(TriggerwareClient& client);

    /// Detaches every member (they become inactive locally) and stops delivery.
    ~BatchSubscription();

    BatchSubscription(const BatchSubscription&) = delete;
    BatchSubscription& operator=(const BatchSubscription&) = delete;

    /// Same as subscription.add_to_batch(*this).
    void add_subscription(Subscription& subscription);

    /// Same as subscription.remove_from_batch(); throws SubscriptionError
    /// if the subscription is not a member of this batch.
    void remove_subscription(Subscription& subscription);

    [[nodiscard]] bool contains(const Subscription& subscription) const;
    [[nodiscard]] size_t size() const { return members_.size(); }

    [[nodiscard]] const std::string& method_name() const { return method_name_; }
    [[nodiscard]] TriggerwareClient& client() const { return *client_; }

private:
    friend class Subscription;
    struct Registry;

    void attach(Subscription& subscription);
    void detach(const Subscription& subscription);

    TriggerwareClient* client_;
    std::string method_name_;
    std::map<std::string, Subscription*> members_;
    std::shared_ptr<Registry> registry_;  // shared with the dispatch handler
};

} // namespace triggerware
