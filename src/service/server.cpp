#include <spdlog/spdlog.h>
#include <vellum/audit/report.hpp>
#include <vellum/schema/enum_string.hpp>
#include <vellum/service/server.hpp>

#include <string>
#include <utility>

using namespace vellum::service;
using namespace vellum::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

grpc::ServerUnaryReactor* finish_error(grpc::CallbackServerContext* context,
                                       const vellum::common::error& error) {
  spdlog::debug("Request failed ({}): {}",
                vellum::common::to_string(error.code()), error.what());
  auto* reactor = context->DefaultReactor();
  reactor->Finish(to_status(error));
  return reactor;
}

/// Run a handler body and finish the call with OK or the mapped error.
template <typename Body>
grpc::ServerUnaryReactor* handle(grpc::CallbackServerContext* context,
                                 Body&& body) {
  try {
    body();
  } catch (const vellum::common::error& e) {
    return finish_error(context, e);
  }
  return finish_ok(context);
}

template <typename Enum>
Enum parse_enum(const std::string& value, const std::string_view field) {
  auto parsed = try_from_string<Enum>(value);
  if (!parsed) {
    throw vellum::common::validation_error{"unknown " + std::string{field} +
                                           " '" + value + "'"};
  }
  return *parsed;
}

std::optional<std::string> optional_string(const bool present,
                                           const std::string& value) {
  if (!present) {
    return std::nullopt;
  }
  return value;
}

metadata_value_t from_wire(const vellum::rpc::v1::MetadataValue& value) {
  switch (value.kind_case()) {
    case vellum::rpc::v1::MetadataValue::kText:
      return value.text();
    case vellum::rpc::v1::MetadataValue::kInteger:
      return static_cast<int64_t>(value.integer());
    case vellum::rpc::v1::MetadataValue::kNumber:
      return value.number();
    case vellum::rpc::v1::MetadataValue::KIND_NOT_SET:
      break;
  }
  throw vellum::common::validation_error{"metadata value has no kind"};
}

void to_wire(const metadata_value_t& value,
             vellum::rpc::v1::MetadataValue* destination) {
  std::visit(overloaded{[&](const std::string& text) {
                          destination->set_text(text);
                        },
                        [&](const int64_t number) {
                          destination->set_integer(number);
                        },
                        [&](const double number) {
                          destination->set_number(number);
                        }},
             value);
}

request_context_t from_wire(const vellum::rpc::v1::RequestContext& context) {
  return request_context_t{
      .ip_address =
          optional_string(context.has_ip_address(), context.ip_address()),
      .session_id =
          optional_string(context.has_session_id(), context.session_id()),
      .user_agent =
          optional_string(context.has_user_agent(), context.user_agent())};
}

}  // namespace

grpc::Status vellum::service::to_status(const vellum::common::error& error) {
  using enum vellum::common::error_code;
  switch (error.code()) {
    case validation:
      return grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, error.what()};
    case immutable_record:
    case invalid_transition:
      return grpc::Status{grpc::StatusCode::FAILED_PRECONDITION, error.what()};
    case conflict:
      return grpc::Status{grpc::StatusCode::ABORTED, error.what()};
    case busy:
      return grpc::Status{grpc::StatusCode::UNAVAILABLE, error.what()};
    case not_found:
      return grpc::Status{grpc::StatusCode::NOT_FOUND, error.what()};
  }
  return grpc::Status{grpc::StatusCode::UNKNOWN, error.what()};
}

void vellum::service::populate_entry(const audit_entry_t& source,
                                     vellum::rpc::v1::AuditEntry* destination) {
  destination->set_id(source.id);
  destination->set_tenant_id(source.tenant_id);
  if (source.sequence_reference) {
    destination->set_sequence_reference(*source.sequence_reference);
  }
  destination->set_event_type(std::string{to_string(source.event_type)});
  destination->set_severity(std::string{to_string(source.severity)});
  destination->set_actor_id(source.actor_id);
  destination->set_timestamp_ms(source.timestamp);
  if (source.subject_ref) {
    destination->mutable_subject_ref()->set_type(source.subject_ref->type);
    destination->mutable_subject_ref()->set_id(source.subject_ref->id);
  }
  destination->set_description(source.description);
  if (source.before_state) {
    destination->set_before_state(*source.before_state);
  }
  if (source.after_state) {
    destination->set_after_state(*source.after_state);
  }
  for (const auto& [key, value] : source.metadata) {
    to_wire(value, &(*destination->mutable_metadata())[key]);
  }
  auto* context = destination->mutable_context();
  if (source.context.ip_address) {
    context->set_ip_address(*source.context.ip_address);
  }
  if (source.context.session_id) {
    context->set_session_id(*source.context.session_id);
  }
  if (source.context.user_agent) {
    context->set_user_agent(*source.context.user_agent);
  }
  destination->set_content_hash(source.content_hash);
  destination->set_previous_hash(source.previous_hash);
  destination->set_lifecycle_state(
      std::string{to_string(source.lifecycle_state)});
}

listener::listener(vellum::audit::audit_store& store,
                   vellum::audit::recorder& recorder,
                   vellum::audit::workflow& workflow)
    : store_{store}, recorder_{recorder}, workflow_{workflow}, verifier_{store} {}

grpc::ServerUnaryReactor* listener::Log(
    grpc::CallbackServerContext* context,
    const vellum::rpc::v1::LogRequest* request,
    vellum::rpc::v1::EntryResponse* response) {
  return handle(context, [&] {
    auto options = vellum::audit::log_options{};
    if (!request->severity().empty()) {
      options.severity = parse_enum<severity_t>(request->severity(), "severity");
    }
    if (request->has_actor_id()) {
      options.actor_id = request->actor_id();
    }
    if (request->has_timestamp_ms()) {
      options.timestamp = request->timestamp_ms();
    }
    if (request->has_subject_ref()) {
      options.subject_ref = subject_ref_t{.type = request->subject_ref().type(),
                                          .id = request->subject_ref().id()};
    }
    options.before_state =
        optional_string(request->has_before_state(), request->before_state());
    options.after_state =
        optional_string(request->has_after_state(), request->after_state());
    for (const auto& [key, value] : request->metadata()) {
      options.metadata.emplace(key, from_wire(value));
    }
    options.context = from_wire(request->context());

    auto entry = recorder_.log(
        request->tenant_id(),
        parse_enum<event_type_t>(request->event_type(), "event_type"),
        request->description(), options);
    populate_entry(entry, response->mutable_entry());
  });
}

grpc::ServerUnaryReactor* listener::Validate(
    grpc::CallbackServerContext* context,
    const vellum::rpc::v1::EntryRequest* request,
    vellum::rpc::v1::EntryResponse* response) {
  return handle(context, [&] {
    populate_entry(workflow_.validate(request->id()), response->mutable_entry());
  });
}

grpc::ServerUnaryReactor* listener::FlagForReview(
    grpc::CallbackServerContext* context,
    const vellum::rpc::v1::FlagForReviewRequest* request,
    vellum::rpc::v1::EntryResponse* response) {
  return handle(context, [&] {
    populate_entry(workflow_.flag_for_review(request->id(), request->reason()),
                   response->mutable_entry());
  });
}

grpc::ServerUnaryReactor* listener::ResolveReview(
    grpc::CallbackServerContext* context,
    const vellum::rpc::v1::EntryRequest* request,
    vellum::rpc::v1::EntryResponse* response) {
  return handle(context, [&] {
    populate_entry(workflow_.resolve_review(request->id()),
                   response->mutable_entry());
  });
}

grpc::ServerUnaryReactor* listener::Archive(
    grpc::CallbackServerContext* context,
    const vellum::rpc::v1::EntryRequest* request,
    vellum::rpc::v1::EntryResponse* response) {
  return handle(context, [&] {
    populate_entry(workflow_.archive(request->id()), response->mutable_entry());
  });
}

grpc::ServerUnaryReactor* listener::VerifyTenant(
    grpc::CallbackServerContext* context,
    const vellum::rpc::v1::VerifyTenantRequest* request,
    vellum::rpc::v1::VerifyTenantResponse* response) {
  return handle(context, [&] {
    auto errors = verifier_.verify_tenant(request->tenant_id());
    response->set_consistent(errors.empty());
    for (const auto& error : errors) {
      auto* wire = response->add_errors();
      wire->set_kind(std::string{to_string(error.kind)});
      wire->set_entry_id(error.entry_id);
    }
  });
}

grpc::ServerUnaryReactor* listener::ListForTenant(
    grpc::CallbackServerContext* context,
    const vellum::rpc::v1::ListForTenantRequest* request,
    vellum::rpc::v1::ListForTenantResponse* response) {
  return handle(context, [&] {
    auto cursor = store_.cursor_for_tenant(request->tenant_id());
    while (auto entry = cursor.next()) {
      populate_entry(*entry, response->add_entries());
    }
  });
}

grpc::ServerUnaryReactor* listener::Report(
    grpc::CallbackServerContext* context,
    const vellum::rpc::v1::ReportRequest* request,
    vellum::rpc::v1::ReportResponse* response) {
  return handle(context, [&] {
    auto from = request->has_from_ms()
                    ? std::optional<timestamp_milliseconds_t>{request->from_ms()}
                    : std::nullopt;
    auto to = request->has_to_ms()
                  ? std::optional<timestamp_milliseconds_t>{request->to_ms()}
                  : std::nullopt;
    auto report =
        vellum::audit::build_report(store_, request->tenant_id(), from, to);
    response->set_tenant_id(report.tenant_id);
    response->set_total(report.total);
    for (const auto& [name, count] : report.by_event_type) {
      (*response->mutable_by_event_type())[name] = count;
    }
    for (const auto& [name, count] : report.by_actor) {
      (*response->mutable_by_actor())[name] = count;
    }
    for (const auto& [name, count] : report.by_severity) {
      (*response->mutable_by_severity())[name] = count;
    }
    for (const auto& [name, count] : report.by_state) {
      (*response->mutable_by_state())[name] = count;
    }
    response->set_awaiting_review(report.awaiting_review);
  });
}
