#include "acp/bridge.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

#include "acp/jsonrpc.hpp"
#include "acp/prompt.hpp"
#include "acp/protocol.hpp"
#include "acp/replay.hpp"
#include "core/error.hpp"
#include "core/uuid.hpp"
#include "core/version.hpp"
#include "pi/rpc_process.hpp"
#include "session/session_directory.hpp"

namespace piacp::acp {

namespace fs = std::filesystem;

namespace {

std::string string_field(const json& obj, const char* key) {
  if (obj.is_object()) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return "";
}

// "provider/id", or just the id when pi reports no provider
std::string model_id(const json& model) {
  auto id = string_field(model, "id");
  auto provider = string_field(model, "provider");
  if (id.empty()) return "";
  return provider.empty() ? id : provider + "/" + id;
}

}  // namespace

std::string to_string(BridgeState state) {
  switch (state) {
    case BridgeState::Uninitialized:
      return "uninitialized";
    case BridgeState::Initialized:
      return "initialized";
    case BridgeState::SessionActive:
      return "session_active";
    case BridgeState::Prompting:
      return "prompting";
    case BridgeState::Closed:
      return "closed";
  }
  return "unknown";
}

std::shared_ptr<AcpBridge> AcpBridge::create(std::shared_ptr<net::MessageChannel> channel, BridgeOptions options) {
  return std::shared_ptr<AcpBridge>(new AcpBridge(std::move(channel), std::move(options)));
}

AcpBridge::AcpBridge(std::shared_ptr<net::MessageChannel> channel, BridgeOptions options)
    : channel_(std::move(channel)), options_(std::move(options)) {
  if (!options_.process_factory) {
    options_.process_factory = [](const SpawnOptions& spawn) -> std::shared_ptr<PiProcess> { return PiRpcProcess::spawn(spawn); };
  }
}

AcpBridge::~AcpBridge() {
  close();
}

bool AcpBridge::is_out_of_band(const json& message) {
  if (!message.is_object()) return false;
  auto method = string_field(message, "method");
  return method == methods::kSessionCancel || method == methods::kToolApproval || method == methods::kToolUserInput;
}

BridgeState AcpBridge::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::optional<SessionId> AcpBridge::session_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (live_) return live_->id;
  return std::nullopt;
}

std::optional<std::string> AcpBridge::last_session_cwd() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_session_cwd_;
}

void AcpBridge::set_last_session_cwd(std::string cwd) {
  std::lock_guard<std::mutex> lock(mutex_);
  last_session_cwd_ = std::move(cwd);
}

// ============================================================================
// Dispatch
// ============================================================================

void AcpBridge::handle_message(const json& message) {
  if (state() == BridgeState::Closed) {
    return;
  }

  auto msg = JsonRpcMessage::classify(message);

  if (msg.kind == MessageKind::Response) {
    spdlog::debug("[bridge] ignoring response id={}", msg.id.dump());
    return;
  }

  if (msg.kind == MessageKind::Invalid) {
    spdlog::warn("[bridge] invalid request on {}: {}", channel_->id(), msg.invalid_reason);
    send(make_error(nullptr, errors::invalid_request(msg.invalid_reason)));
    return;
  }

  spdlog::debug("[bridge] {} {}", channel_->id(), msg.method);

  try {
    json result = dispatch(msg.method, msg.params);
    if (msg.is_request()) {
      send(make_result(msg.id, std::move(result)));
    }
  } catch (const AcpError& e) {
    if (msg.is_request()) {
      send(make_error(msg.id, e));
    } else {
      spdlog::warn("[bridge] notification {} failed: {}", msg.method, e.what());
    }
  } catch (const std::exception& e) {
    spdlog::error("[bridge] {} failed unexpectedly: {}", msg.method, e.what());
    if (msg.is_request()) {
      send(make_error(msg.id, errors::internal_from(e)));
    }
  }

  flush_deferred();
}

json AcpBridge::dispatch(const std::string& method, const json& params) {
  if (method == methods::kInitialize) {
    return handle_initialize(params);
  }
  if (method == methods::kInitialized) {
    return nullptr;
  }

  static const std::vector<std::string> session_methods = {
      methods::kSessionNew,    methods::kSessionLoad,  methods::kSessionResume, methods::kSessionList,  methods::kSessionCancel,
      methods::kSessionPrompt, methods::kToolApproval, methods::kToolUserInput, methods::kGenUIAction,
  };
  if (std::find(session_methods.begin(), session_methods.end(), method) == session_methods.end()) {
    throw errors::method_not_found(method);
  }

  require_initialized(method);

  if (method == methods::kSessionNew) return handle_session_new(params);
  if (method == methods::kSessionLoad) return handle_session_open(params, false);
  if (method == methods::kSessionResume) return handle_session_open(params, true);
  if (method == methods::kSessionList) return handle_session_list(params);
  if (method == methods::kSessionPrompt) return handle_prompt(params);
  if (method == methods::kToolApproval) return handle_tool_approval(params);
  if (method == methods::kToolUserInput) return handle_user_input(params);
  if (method == methods::kGenUIAction) return handle_genui_action(params);

  handle_cancel(params);
  return nullptr;
}

void AcpBridge::require_initialized(const std::string& method) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == BridgeState::Uninitialized) {
    throw errors::not_initialized(method);
  }
}

std::shared_ptr<PiProcess> AcpBridge::require_process(const SessionId& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!live_ || live_->id != session_id) {
    throw errors::session_not_found(session_id);
  }
  if (live_->exited) {
    throw errors::internal("pi process has exited", {{"sessionId", session_id}});
  }
  return live_->process;
}

// ============================================================================
// initialize
// ============================================================================

json AcpBridge::handle_initialize(const json& params) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != BridgeState::Uninitialized) {
      throw errors::already_initialized();
    }
    state_ = BridgeState::Initialized;
    if (params.is_object() && params.contains("clientCapabilities") && params["clientCapabilities"].is_object()) {
      client_capabilities_ = params["clientCapabilities"];
    }
  }

  int version = PIACP_PROTOCOL_VERSION;
  if (params.is_object() && params.contains("protocolVersion") && params["protocolVersion"].is_number_integer()) {
    version = std::min(params["protocolVersion"].get<int>(), PIACP_PROTOCOL_VERSION);
  }

  return {
      {"protocolVersion", version},
      {"agentCapabilities",
       {{"loadSession", true},
        {"promptCapabilities", {{"image", true}, {"audio", false}, {"embeddedContext", true}}},
        {"sessionCapabilities", {{"list", json::object()}, {"resume", json::object()}}}}},
      {"agentInfo", {{"name", "pi-acp"}, {"title", "pi"}, {"version", PIACP_VERSION_STRING}}},
      {"authMethods", json::array()},
  };
}

// ============================================================================
// Session lifecycle
// ============================================================================

std::unique_ptr<AcpBridge::LiveSession> AcpBridge::spawn_session(const std::string& cwd, const std::optional<fs::path>& session_file) {
  SpawnOptions spawn = options_.spawn;
  spawn.cwd = cwd;
  spawn.session_file = session_file;

  std::shared_ptr<PiProcess> process;
  try {
    process = options_.process_factory(spawn);
  } catch (const AcpError&) {
    throw;
  } catch (const std::exception& e) {
    throw errors::internal("Failed to start pi: " + std::string(e.what()), {{"command", spawn.command}, {"cwd", cwd}});
  }
  if (!process) {
    throw errors::internal("Failed to start pi", {{"command", spawn.command}, {"cwd", cwd}});
  }

  auto live = std::make_unique<LiveSession>();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    live->serial = next_serial_++;
  }
  live->cwd = cwd;
  live->process = process;

  std::weak_ptr<AcpBridge> weak = weak_from_this();
  auto serial = live->serial;
  live->subscription = process->on_event([weak, serial](const json& event) {
    if (auto self = weak.lock()) {
      self->on_pi_event(serial, event);
    }
  });
  return live;
}

void AcpBridge::install(std::unique_ptr<LiveSession> live) {
  std::unique_ptr<LiveSession> old;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == BridgeState::Closed) {
      old = std::move(live);
    } else {
      old = std::move(live_);
      live_ = std::move(live);
      state_ = BridgeState::SessionActive;
      last_session_cwd_ = live_->cwd;
      spdlog::info("[bridge] {} session {} active (cwd={})", channel_->id(), live_->id, live_->cwd);
    }
  }
  if (old) {
    retire(std::move(old));
  }
}

void AcpBridge::retire(std::unique_ptr<LiveSession> live) {
  if (!live || !live->process) {
    return;
  }
  spdlog::info("[bridge] retiring session {}", live->id);
  live->process->off_event(live->subscription);
  live->process->shutdown();

  // Reaping may block; never on the caller's thread
  std::thread([process = std::move(live->process)]() mutable { process.reset(); }).detach();
}

void AcpBridge::close() {
  std::unique_ptr<LiveSession> live;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == BridgeState::Closed) {
      return;
    }
    state_ = BridgeState::Closed;
    live = std::move(live_);
    if (live && live->turn) {
      live->turn->cancelled = true;
      live->turn->done = true;
    }
  }
  turn_cv_.notify_all();
  retire(std::move(live));
}

json AcpBridge::handle_session_new(const json& params) {
  auto cwd = require_string(params, "cwd");

  auto live = spawn_session(cwd, std::nullopt);
  auto process = live->process;

  json state;
  json models;
  try {
    state = await(process->get_state(), "get_state");
    models = await(process->get_available_models(), "get_available_models");
  } catch (const std::exception&) {
    retire(std::move(live));
    throw;
  }

  auto pi_session = string_field(state, "sessionId");
  live->id = pi_session.empty() ? UUID::generate() : pi_session;
  live->file_commands = load_file_commands(options_.agent_dir, cwd);

  auto session_id = live->id;
  auto serial = live->serial;
  auto commands = live->file_commands;
  auto info = startup_info(state, cwd);
  json response = session_response(session_id, cwd, models, state, json(info));

  install(std::move(live));

  std::weak_ptr<AcpBridge> weak = weak_from_this();
  defer([weak, serial, session_id, info] {
    auto self = weak.lock();
    if (!self || !self->is_live(serial)) return;
    self->send_update(session_id, updates::agent_message_chunk(info));
  });
  defer([weak, serial, session_id, commands] {
    auto self = weak.lock();
    if (!self || !self->is_live(serial)) return;
    auto all = builtin_commands();
    all.insert(all.end(), commands.begin(), commands.end());
    self->send_update(session_id, updates::available_commands_update(commands_to_json(all)));
  });

  return response;
}

json AcpBridge::handle_session_open(const json& params, bool resume) {
  auto session_id = require_string(params, "sessionId");

  SessionDirectory directory(options_.sessions_dir);
  auto listing = directory.find(session_id);
  if (!listing) {
    throw errors::session_not_found(session_id);
  }
  auto cwd = optional_string(params, "cwd").value_or(listing->cwd);

  auto live = spawn_session(cwd, listing->session_file);
  live->id = session_id;
  auto process = live->process;

  json messages;
  json state;
  json models;
  try {
    messages = await(process->get_messages(), "get_messages");
    state = await(process->get_state(), "get_state");
    models = await(process->get_available_models(), "get_available_models");
  } catch (const std::exception&) {
    retire(std::move(live));
    throw;
  }

  auto replay = replay_messages(messages.value("messages", json::array()), live->tool_calls);
  live->tool_calls.clear();
  live->file_commands = load_file_commands(options_.agent_dir, cwd);

  auto serial = live->serial;
  auto commands = live->file_commands;
  // Startup info is only for brand-new sessions
  json response = session_response(session_id, cwd, models, state, nullptr);

  install(std::move(live));

  spdlog::info("[bridge] {} {} replaying {} updates", resume ? "resume" : "load", session_id, replay.size());
  for (const auto& update : replay) {
    send_update(session_id, update);
  }

  std::weak_ptr<AcpBridge> weak = weak_from_this();
  defer([weak, serial, session_id, commands] {
    auto self = weak.lock();
    if (!self || !self->is_live(serial)) return;
    auto all = builtin_commands();
    all.insert(all.end(), commands.begin(), commands.end());
    self->send_update(session_id, updates::available_commands_update(commands_to_json(all)));
  });

  return response;
}

json AcpBridge::handle_session_list(const json& params) {
  auto cwd = optional_string(params, "cwd");
  if (!cwd) {
    cwd = last_session_cwd();
  }

  SessionDirectory directory(options_.sessions_dir);
  json sessions = json::array();
  for (const auto& listing : directory.list(cwd)) {
    sessions.push_back(listing.to_json());
  }
  return {{"sessions", sessions}};
}

bool AcpBridge::is_live(uint64_t serial) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_ && live_->serial == serial;
}

json AcpBridge::session_response(const SessionId& session_id, const std::string& cwd, const json& models, const json& state,
                                 const json& startup) const {
  json available = json::array();
  if (models.is_object() && models.contains("models") && models["models"].is_array()) {
    for (const auto& model : models["models"]) {
      auto id = model_id(model);
      if (id.empty()) continue;
      auto name = string_field(model, "name");
      available.push_back({{"modelId", id}, {"name", name.empty() ? string_field(model, "id") : name}});
    }
  }

  json current = nullptr;
  if (state.is_object() && state.contains("model")) {
    auto id = model_id(state["model"]);
    if (!id.empty()) current = id;
  }
  if (current.is_null() && !available.empty()) {
    current = available.front()["modelId"];
  }

  return {
      {"sessionId", session_id},
      {"models", {{"availableModels", available}, {"currentModelId", current}}},
      {"_meta", {{"piAcp", {{"startupInfo", startup}, {"cwd", cwd}}}}},
  };
}

std::string AcpBridge::startup_info(const json& state, const std::string& cwd) const {
  std::string info = "pi-acp " PIACP_VERSION_STRING;
  if (state.is_object() && state.contains("model")) {
    auto id = model_id(state["model"]);
    if (!id.empty()) info += "\nModel: " + id;
  }
  auto thinking = string_field(state, "thinkingLevel");
  if (!thinking.empty()) {
    info += "\nThinking level: " + thinking;
  }
  info += "\nWorking directory: " + cwd;
  return info;
}

// ============================================================================
// Prompt
// ============================================================================

json AcpBridge::handle_prompt(const json& params) {
  auto session_id = require_string(params, "sessionId");
  auto process = require_process(session_id);

  if (!params.contains("prompt") || !params["prompt"].is_array()) {
    throw params.contains("prompt") ? errors::param_type("prompt", "array", params["prompt"]) : errors::missing_param("prompt");
  }
  const auto& blocks = params["prompt"];

  // Local commands never reach pi
  if (auto command = parse_slash_command(blocks); command && (command->name == "steering" || command->name == "name")) {
    return handle_local_command(session_id, process, *command);
  }

  auto pi_prompt = prompt_to_pi_message(blocks);
  auto turn = std::make_shared<Turn>();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!live_ || live_->id != session_id) {
      throw errors::session_not_found(session_id);
    }
    if (live_->exited) {
      throw errors::internal("pi process has exited", {{"sessionId", session_id}});
    }
    if (live_->turn) {
      if (live_->turn->awaited) {
        throw errors::server_error("A prompt is already running for session " + session_id);
      }
      // A GenUI-started turn is still streaming; its agent_end is not ours
      live_->turn->done = true;
      ++live_->orphan_ends;
    }
    live_->turn = turn;
    state_ = BridgeState::Prompting;
  }

  auto end_turn = [&] {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == BridgeState::Prompting) state_ = BridgeState::SessionActive;
    if (live_ && live_->turn == turn) live_->turn.reset();
  };

  try {
    await(process->prompt(pi_prompt.message, pi_prompt.images), "prompt");
  } catch (const std::exception&) {
    end_turn();
    throw;
  }

  {
    std::unique_lock<std::mutex> lock(mutex_);
    turn_cv_.wait(lock, [&] { return turn->done || turn->cancelled; });
    if (turn->cancelled && !turn->done) {
      turn_cv_.wait_for(lock, options_.abort_grace, [&] { return turn->done; });
      if (!turn->done && live_ && live_->turn == turn) {
        spdlog::warn("[bridge] pi did not confirm abort of {}", session_id);
        live_->turn.reset();
        ++live_->orphan_ends;
      }
    }
    if (state_ == BridgeState::Prompting) state_ = BridgeState::SessionActive;
  }

  if (turn->cancelled) {
    return {{"stopReason", to_string(StopReason::Cancelled)}};
  }
  if (turn->error) {
    throw errors::internal(*turn->error, {{"sessionId", session_id}});
  }
  return {{"stopReason", to_string(turn->stop_reason)}};
}

json AcpBridge::handle_local_command(const SessionId& session_id, const std::shared_ptr<PiProcess>& process, const SlashCommand& command) {
  if (command.name == "steering") {
    auto state = await(process->get_state(), "get_state");
    auto mode = string_field(state, "steeringMode");
    send_update(session_id, updates::agent_message_chunk("Steering mode: " + (mode.empty() ? std::string("unknown") : mode)));
  } else if (command.args.empty()) {
    send_update(session_id, updates::agent_message_chunk("Usage: /name <session name>"));
  } else {
    await(process->set_session_name(command.args), "set_session_name");
    send_update(session_id, updates::session_info_update(command.args));
    send_update(session_id, updates::agent_message_chunk("Session name set: " + command.args));
  }
  return {{"stopReason", to_string(StopReason::EndTurn)}};
}

void AcpBridge::handle_cancel(const json& params) {
  auto session_id = require_string(params, "sessionId");

  std::shared_ptr<PiProcess> process;
  bool abort = false;
  std::vector<std::string> dropped;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!live_ || live_->id != session_id) {
      throw errors::session_not_found(session_id);
    }
    process = live_->process;
    if (live_->turn && !live_->turn->cancelled && !live_->turn->done) {
      live_->turn->cancelled = true;
      abort = true;
    }
    for (const auto& [request_id, interaction] : live_->interactions) {
      dropped.push_back(request_id);
    }
    live_->interactions.clear();
  }

  if (abort) {
    spdlog::info("[bridge] cancelling prompt on {}", session_id);
    process->abort();
  }
  for (const auto& request_id : dropped) {
    try {
      process->send_ui_response({{"id", request_id}, {"cancelled", true}});
    } catch (const PiRpcError& e) {
      spdlog::warn("[bridge] could not cancel ui request {}: {}", request_id, e.what());
    }
  }
  turn_cv_.notify_all();
}

// ============================================================================
// Tool interactions and GenUI
// ============================================================================

json AcpBridge::handle_tool_approval(const json& params) {
  auto session_id = require_string(params, "sessionId");
  auto request_id = require_string(params, "requestId");
  if (!params.contains("approved")) {
    throw errors::missing_param("approved");
  }
  if (!params["approved"].is_boolean()) {
    throw errors::param_type("approved", "boolean", params["approved"]);
  }
  bool approved = params["approved"].get<bool>();

  std::shared_ptr<PiProcess> process;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!live_ || live_->id != session_id) {
      throw errors::session_not_found(session_id);
    }
    auto it = live_->interactions.find(request_id);
    if (it == live_->interactions.end() || it->second.kind != PendingInteraction::Kind::Approval) {
      throw errors::tool_not_found(request_id);
    }
    live_->interactions.erase(it);
    process = live_->process;
  }

  try {
    process->send_ui_response({{"id", request_id}, {"confirmed", approved}});
  } catch (const PiRpcError& e) {
    throw errors::internal(e.what(), {{"requestId", request_id}});
  }

  if (!approved) {
    throw errors::approval_denied(request_id);
  }
  return {{"outcome", "approved"}};
}

json AcpBridge::handle_user_input(const json& params) {
  auto session_id = require_string(params, "sessionId");
  auto request_id = require_string(params, "requestId");
  bool cancelled = params.contains("cancelled") && params["cancelled"].is_boolean() && params["cancelled"].get<bool>();
  std::optional<std::string> value;
  if (!cancelled) {
    value = require_string(params, "value");
  }

  std::shared_ptr<PiProcess> process;
  bool expired = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!live_ || live_->id != session_id) {
      throw errors::session_not_found(session_id);
    }
    auto it = live_->interactions.find(request_id);
    if (it == live_->interactions.end() || it->second.kind != PendingInteraction::Kind::UserInput) {
      throw errors::tool_not_found(request_id);
    }
    expired = std::chrono::steady_clock::now() > it->second.deadline;
    live_->interactions.erase(it);
    process = live_->process;
  }

  json response = {{"id", request_id}};
  if (expired || cancelled) {
    response["cancelled"] = true;
  } else {
    response["value"] = *value;
  }

  try {
    process->send_ui_response(response);
  } catch (const PiRpcError& e) {
    throw errors::internal(e.what(), {{"requestId", request_id}});
  }

  if (expired) {
    throw errors::user_input_timeout(request_id);
  }
  return {{"outcome", cancelled ? "cancelled" : "submitted"}};
}

json AcpBridge::handle_genui_action(const json& params) {
  auto session_id = require_string(params, "sessionId");
  auto action = require_string(params, "action");
  if (trim(action).empty()) {
    throw errors::invalid_params("action must be a non-empty string", {{"param", "action"}});
  }
  auto process = require_process(session_id);

  std::string message = "[GenUI action] " + action;
  if (params.contains("payload") && !params["payload"].is_null()) {
    message += "\n" + params["payload"].dump(2);
  }

  std::shared_ptr<Turn> turn;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (live_ && live_->id == session_id && !live_->turn) {
      turn = std::make_shared<Turn>();
      turn->awaited = false;
      live_->turn = turn;
    }
  }

  try {
    await(process->prompt(message, {}), "prompt");
  } catch (const std::exception& e) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (turn && live_ && live_->turn == turn) live_->turn.reset();
    throw errors::genui_action_failed(action, e.what());
  }
  return {{"accepted", true}};
}

// ============================================================================
// pi events
// ============================================================================

void AcpBridge::on_pi_event(uint64_t serial, const json& event) {
  std::vector<json> to_send;
  SessionId session_id;
  bool wake = false;
  auto type = string_field(event, "type");

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!live_ || live_->serial != serial) {
      return;
    }
    session_id = live_->id;
    auto& turn = live_->turn;

    if (type == "extension_ui_request") {
      auto request_id = string_field(event, "id");
      auto method = string_field(event, "method");
      auto title = string_field(event, "title");
      if (request_id.empty()) {
        spdlog::debug("[bridge] extension_ui_request without id");
      } else if (method == "confirm") {
        live_->interactions[request_id] = {PendingInteraction::Kind::Approval, method, std::chrono::steady_clock::time_point::max()};
        to_send.push_back(updates::tool_approval_request(request_id, title, string_field(event, "message")));
      } else if (method == "select" || method == "input" || method == "editor") {
        auto timeout = options_.user_input_timeout;
        if (event.contains("timeout") && event["timeout"].is_number() && event["timeout"].get<int64_t>() > 0) {
          timeout = std::chrono::milliseconds(event["timeout"].get<int64_t>());
        }
        live_->interactions[request_id] = {PendingInteraction::Kind::UserInput, method, std::chrono::steady_clock::now() + timeout};
        json extra = json::object();
        for (const char* key : {"options", "placeholder", "prefill"}) {
          if (event.contains(key) && !event[key].is_null()) extra[key] = event[key];
        }
        extra["timeoutMs"] = timeout.count();
        to_send.push_back(updates::user_input_request(request_id, method, title, extra));
      } else {
        spdlog::debug("[bridge] ignoring extension ui method {}", method);
      }
    } else if (type == "agent_end") {
      if (live_->orphan_ends > 0) {
        --live_->orphan_ends;
      } else if (turn) {
        // The last assistant message carries pi's stop reason
        if (event.contains("messages") && event["messages"].is_array()) {
          const auto& messages = event["messages"];
          for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
            if (string_field(*it, "role") != "assistant") continue;
            auto reason = string_field(*it, "stopReason");
            if (reason == "error") {
              auto detail = string_field(*it, "errorMessage");
              turn->error = detail.empty() ? "pi reported an error" : detail;
            } else if (!reason.empty()) {
              turn->stop_reason = stop_reason_from_string(reason);
            }
            break;
          }
        }
        turn->done = true;
        turn.reset();
        wake = true;
      }
    } else if (type == "process_exit") {
      live_->exited = true;
      live_->interactions.clear();
      if (turn) {
        std::string code = event.contains("code") && !event["code"].is_null() ? event["code"].dump() : "unknown";
        turn->error = "pi process exited (code " + code + ")";
        turn->done = true;
        turn.reset();
        wake = true;
      }
      spdlog::warn("[bridge] pi for session {} exited", session_id);
    } else if (turn && !turn->cancelled) {
      to_send = translate_event(event, live_->tool_calls);
    }
  }

  for (const auto& update : to_send) {
    send_update(session_id, update);
  }
  if (wake) {
    turn_cv_.notify_all();
  }
}

// ============================================================================
// Helpers
// ============================================================================

json AcpBridge::await(std::future<json> future, const char* what) const {
  if (future.wait_for(options_.request_timeout) != std::future_status::ready) {
    throw errors::internal(std::string("Timed out waiting for pi ") + what, {{"request", what}});
  }
  try {
    return future.get();
  } catch (const PiRpcError& e) {
    throw errors::internal(e.what(), {{"request", what}});
  }
}

void AcpBridge::send_update(const SessionId& session_id, const json& update) {
  send(session_update(session_id, update));
}

void AcpBridge::send(const json& message) {
  channel_->send(message);
}

void AcpBridge::defer(std::function<void()> task) {
  if (options_.defer) {
    options_.defer(std::move(task));
  } else {
    std::lock_guard<std::mutex> lock(deferred_mutex_);
    deferred_.push_back(std::move(task));
  }
}

void AcpBridge::flush_deferred() {
  std::vector<std::function<void()>> tasks;
  {
    std::lock_guard<std::mutex> lock(deferred_mutex_);
    tasks.swap(deferred_);
  }
  for (auto& task : tasks) {
    task();
  }
}

}  // namespace piacp::acp
