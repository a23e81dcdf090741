#pragma once

#include <grpcpp/grpcpp.h>
#include <vellum/audit/audit_store.hpp>
#include <vellum/audit/chain_verifier.hpp>
#include <vellum/audit/recorder.hpp>
#include <vellum/audit/workflow.hpp>
#include <vellum/common/error.hpp>
#include <vellum/rpc/v1/audit_trail.grpc.pb.h>
#include <vellum/schema/audit_entry.hpp>

namespace vellum::service {

grpc::Status to_status(const vellum::common::error& error);

void populate_entry(const vellum::schema::audit_entry_t& source,
                    vellum::rpc::v1::AuditEntry* destination);

struct listener final : public vellum::rpc::v1::AuditTrail::CallbackService {
  listener(vellum::audit::audit_store& store,
           vellum::audit::recorder& recorder,
           vellum::audit::workflow& workflow);

  virtual grpc::ServerUnaryReactor* Log(
      grpc::CallbackServerContext* context,
      const vellum::rpc::v1::LogRequest* request,
      vellum::rpc::v1::EntryResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Validate(
      grpc::CallbackServerContext* context,
      const vellum::rpc::v1::EntryRequest* request,
      vellum::rpc::v1::EntryResponse* response) override final;

  virtual grpc::ServerUnaryReactor* FlagForReview(
      grpc::CallbackServerContext* context,
      const vellum::rpc::v1::FlagForReviewRequest* request,
      vellum::rpc::v1::EntryResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ResolveReview(
      grpc::CallbackServerContext* context,
      const vellum::rpc::v1::EntryRequest* request,
      vellum::rpc::v1::EntryResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Archive(
      grpc::CallbackServerContext* context,
      const vellum::rpc::v1::EntryRequest* request,
      vellum::rpc::v1::EntryResponse* response) override final;

  virtual grpc::ServerUnaryReactor* VerifyTenant(
      grpc::CallbackServerContext* context,
      const vellum::rpc::v1::VerifyTenantRequest* request,
      vellum::rpc::v1::VerifyTenantResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListForTenant(
      grpc::CallbackServerContext* context,
      const vellum::rpc::v1::ListForTenantRequest* request,
      vellum::rpc::v1::ListForTenantResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Report(
      grpc::CallbackServerContext* context,
      const vellum::rpc::v1::ReportRequest* request,
      vellum::rpc::v1::ReportResponse* response) override final;

  vellum::audit::audit_store& store_;
  vellum::audit::recorder& recorder_;
  vellum::audit::workflow& workflow_;
  vellum::audit::chain_verifier verifier_;
};

}  // namespace vellum::service
