#include "triggerware/client.hpp"
#include "triggerware/queries.hpp"
#include "triggerware/error.hpp"
#include "triggerware/log.hpp"
#include "triggerware/transport/socket_transport.hpp"
#include <algorithm>

namespace triggerware {

namespace {

Connection::Options connection_options(const TriggerwareClient::Options& opts) {
    Connection::Options c;
    c.call_timeout = opts.call_timeout;
    return c;
}

std::unique_ptr<ITransport> connect_tcp(const TriggerwareClient::Options& opts) {
    if (opts.log_level) log::set_level(*opts.log_level);
    return SocketTransport::connect(opts.host, opts.port);
}

} // anonymous namespace

TriggerwareClient::TriggerwareClient(Options opts)
    : TriggerwareClient(connect_tcp(opts), opts) {}

TriggerwareClient::TriggerwareClient(std::unique_ptr<ITransport> transport, Options opts)
    : opts_(std::move(opts)) {
    if (opts_.log_level) log::set_level(*opts_.log_level);
    connection_ = std::make_unique<Connection>(std::move(transport), connection_options(opts_));
    log::logger()->debug("triggerware client {} ready", LIBRARY_VERSION);
}

TriggerwareClient::~TriggerwareClient() {
    close();
}

ResultSet TriggerwareClient::execute_query(const Query& query,
                                           const std::optional<QueryRestriction>& restriction) {
    View view(*this, query, restriction);
    return view.execute();
}

void TriggerwareClient::validate_query(const Query& query) {
    try {
        (void)connection_->call("validate",
                                nlohmann::json::array({query.text, query.language, query.ns}));
    } catch (const TwProtocolError& e) {
        rethrow_as<InvalidQueryError>(e);
    }
}

std::vector<RelDataGroup> TriggerwareClient::get_rel_data() {
    nlohmann::json result = connection_->call("reldata2017", nlohmann::json::array());
    std::vector<RelDataGroup> groups;
    if (!result.is_array()) {
        log::logger()->warn("reldata2017 returned {} instead of an array", result.type_name());
        return groups;
    }
    try {
        groups = result.get<std::vector<RelDataGroup>>();
    } catch (const nlohmann::json::exception& e) {
        throw TwTransportError(std::string("Malformed reldata2017 reply: ") + e.what());
    }
    return groups;
}

void TriggerwareClient::register_handle(int64_t handle) {
    std::lock_guard<std::mutex> lock(handles_mutex_);
    if (std::find(handles_.begin(), handles_.end(), handle) == handles_.end()) {
        handles_.push_back(handle);
    }
}

std::vector<int64_t> TriggerwareClient::handles() const {
    std::lock_guard<std::mutex> lock(handles_mutex_);
    return handles_;
}

void TriggerwareClient::close() {
    if (connection_) connection_->close();
}

bool TriggerwareClient::is_connected() const {
    return connection_ && !connection_->is_closed();
}

} // namespace triggerware
