#include "triggerware/subscription.hpp"
#include "triggerware/client.hpp"
#include "triggerware/queries.hpp"
#include "triggerware/error.hpp"
#include "triggerware/log.hpp"
#include <mutex>
#include <unordered_map>

namespace triggerware {

/// Label -> member handler, read by the dispatch thread.
struct BatchSubscription::Registry {
    std::mutex mutex;
    std::unordered_map<std::string, SubscriptionHandler> handlers;

    SubscriptionHandler find(const std::string& label) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = handlers.find(label);
        return it == handlers.end() ? SubscriptionHandler{} : it->second;
    }
};

// ---------- Subscription ----------

Subscription::Subscription(TriggerwareClient& client, Query query,
                           SubscriptionHandler on_notification)
    : client_(&client),
      query_(std::move(query)),
      on_notification_(std::move(on_notification)),
      label_(client.connection().allocate_name("sub")),
      base_parameters_(query_parameters(query_, std::nullopt)) {
    base_parameters_["label"] = label_;
}

Subscription::~Subscription() {
    if (state_ == SubscriptionState::Active) {
        client_->connection().remove_method(label_);
    } else if (state_ == SubscriptionState::BatchMember && batch_) {
        batch_->detach(*this);
    }
}

nlohmann::json Subscription::request(const std::string& method, bool combine) const {
    nlohmann::json params = base_parameters_;
    params["method"] = method;
    params["combine"] = combine;
    return params;
}

void Subscription::activate() {
    if (state_ == SubscriptionState::BatchMember) {
        throw SubscriptionError("Cannot activate subscription that is part of a batch.");
    }
    if (state_ == SubscriptionState::Active) {
        throw SubscriptionError("Subscription is already active.");
    }

    Connection& conn = client_->connection();
    MethodHandler handler;
    handler.execute = [](const nlohmann::json&) -> HandlerResult { return nlohmann::json::object(); };
    handler.notify = [label = label_, callback = on_notification_](const nlohmann::json& params) {
        if (!params.contains("tuple")) {
            log::logger()->debug("Subscription {} ignored notification without a tuple", label);
            return;
        }
        if (callback) callback(params["tuple"]);
    };
    conn.add_method(label_, std::move(handler));

    try {
        (void)conn.call("subscribe", request(label_, false));
    } catch (const TwProtocolError& e) {
        conn.remove_method(label_);
        rethrow_as<SubscriptionError>(e, "subscribe failed");
    } catch (...) {
        conn.remove_method(label_);
        throw;
    }
    state_ = SubscriptionState::Active;
    log::logger()->debug("Subscription {} activated", label_);
}

void Subscription::deactivate() {
    if (state_ == SubscriptionState::BatchMember) {
        throw SubscriptionError("Cannot deactivate a subscription that is part of a batch.");
    }
    if (state_ != SubscriptionState::Active) {
        throw SubscriptionError("Subscription is already inactive.");
    }

    Connection& conn = client_->connection();
    try {
        (void)conn.call("unsubscribe", request(label_, false));
    } catch (const TwProtocolError& e) {
        rethrow_as<SubscriptionError>(e, "unsubscribe failed");
    }
    conn.remove_method(label_);
    state_ = SubscriptionState::Inactive;
    log::logger()->debug("Subscription {} deactivated", label_);
}

void Subscription::add_to_batch(BatchSubscription& batch) {
    if (state_ == SubscriptionState::Active) {
        throw SubscriptionError("Cannot add active subscription to a batch.");
    }
    if (state_ == SubscriptionState::BatchMember) {
        throw SubscriptionError("Subscription is already part of another batch.");
    }
    if (client_ != batch.client_) {
        throw SubscriptionError("Subscription and batch registered with different clients.");
    }

    batch.attach(*this);
    try {
        (void)client_->connection().call("subscribe", request(batch.method_name_, true));
    } catch (const TwProtocolError& e) {
        batch.detach(*this);
        rethrow_as<SubscriptionError>(e, "subscribe failed");
    } catch (...) {
        batch.detach(*this);
        throw;
    }
    batch_ = &batch;
    state_ = SubscriptionState::BatchMember;
}

void Subscription::remove_from_batch() {
    if (state_ != SubscriptionState::BatchMember || !batch_) {
        throw SubscriptionError("Subscription is not part of a batch.");
    }

    try {
        (void)client_->connection().call("unsubscribe", request(batch_->method_name_, true));
    } catch (const TwProtocolError& e) {
        rethrow_as<SubscriptionError>(e, "unsubscribe failed");
    }
    batch_->detach(*this);
    batch_ = nullptr;
    state_ = SubscriptionState::Inactive;
}

// ---------- BatchSubscription ----------

BatchSubscription::BatchSubscription(TriggerwareClient& client)
    : client_(&client),
      method_name_(client.connection().allocate_name("batch")),
      registry_(std::make_shared<Registry>()) {
    MethodHandler handler;
    handler.execute = [](const nlohmann::json&) -> HandlerResult { return nlohmann::json::object(); };
    handler.notify = [name = method_name_, registry = registry_](const nlohmann::json& params) {
        if (!params.contains("matches") || !params["matches"].is_array()) {
            log::logger()->debug("Batch {} ignored notification without matches", name);
            return;
        }
        for (const auto& match : params["matches"]) {
            if (!match.is_object()) continue;
            auto label = match.find("label");
            auto tuples = match.find("tuples");
            if (label == match.end() || !label->is_string()) continue;
            if (tuples == match.end() || !tuples->is_array()) continue;
            auto callback = registry->find(label->get<std::string>());
            if (!callback) continue;
            for (const auto& tuple : *tuples) {
                callback(tuple);
            }
        }
    };
    client_->connection().add_method(method_name_, std::move(handler));
}

BatchSubscription::~BatchSubscription() {
    client_->connection().remove_method(method_name_);
    for (auto& entry : members_) {
        entry.second->batch_ = nullptr;
        entry.second->state_ = SubscriptionState::Inactive;
    }
}

void BatchSubscription::add_subscription(Subscription& subscription) {
    subscription.add_to_batch(*this);
}

void BatchSubscription::remove_subscription(Subscription& subscription) {
    if (!contains(subscription)) {
        throw SubscriptionError("Subscription is not part of this batch.");
    }
    subscription.remove_from_batch();
}

bool BatchSubscription::contains(const Subscription& subscription) const {
    auto it = members_.find(subscription.label_);
    return it != members_.end() && it->second == &subscription;
}

void BatchSubscription::attach(Subscription& subscription) {
    members_[subscription.label_] = &subscription;
    std::lock_guard<std::mutex> lock(registry_->mutex);
    registry_->handlers[subscription.label_] = subscription.on_notification_;
}

void BatchSubscription::detach(const Subscription& subscription) {
    members_.erase(subscription.label_);
    std::lock_guard<std::mutex> lock(registry_->mutex);
    registry_->handlers.erase(subscription.label_);
}

} // namespace triggerware
