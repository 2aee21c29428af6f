#include "index_service.hpp"

#include <variant>

IndexService::IndexService(DirectoryStore& store,
                           std::set<std::string> accepted_tokens,
                           std::shared_ptr<Logger> logger)
  : store_(store),
    accepted_tokens_(std::move(accepted_tokens)),
    logger_(std::move(logger)) {}

bool IndexService::accepts(const std::string& token) const {
  return accepted_tokens_.count(token) > 0;
}

std::string IndexService::handle_line(const std::string& line, const std::string& origin) {
  std::string error;
  auto request = parse_control_request(line, error);
  if(!request) {
    log_warn(logger_.get(), "[{}] rejected request: {}", origin, error);
    return format_error(ReplyCode::BadRequest, error);
  }

  const auto& token = request_token(*request);
  if(!accepts(token)) {
    log_warn(logger_.get(), "[{}] {} with unsupported token '{}'", origin, request_verb(*request), token);
    return format_error(ReplyCode::UnsupportedToken, token);
  }

  return std::visit([&](const auto& r){ return handle(r, origin); }, *request);
}

std::string IndexService::handle(const AddRequest& request, const std::string& origin) {
  auto status = store_.register_document(request.id, request.title, request.address);
  log_info(logger_.get(), "[{}] ADD {} '{}' from {}: {}",
           origin, request.id, request.title, request.address.to_string(),
           register_status_name(status));

  switch(status) {
    case DirectoryStore::RegisterStatus::Created:
    case DirectoryStore::RegisterStatus::HolderAdded:
    case DirectoryStore::RegisterStatus::AlreadyHolder:
      log_info(logger_.get(), "Directory now holds {} document(s)", store_.size());
      return format_ok();
    case DirectoryStore::RegisterStatus::InvalidId:
      return format_error(ReplyCode::InvalidId, "document id must be positive");
    case DirectoryStore::RegisterStatus::InvalidAddress:
      return format_error(ReplyCode::InvalidAddress, request.address.to_string());
    case DirectoryStore::RegisterStatus::InvalidTitle:
      return format_error(ReplyCode::InvalidTitle);
  }
  return format_error(ReplyCode::BadRequest);
}

std::string IndexService::handle(const LookupRequest& request, const std::string& origin) {
  auto holders = store_.find(request.id);
  if(!holders) {
    log_info(logger_.get(), "[{}] LOOKUP {}: not found", origin, request.id);
    return format_error(ReplyCode::NotFound);
  }
  log_info(logger_.get(), "[{}] LOOKUP {}: {} holder(s)", origin, request.id, holders->size());
  std::string reply = format_ok(holders->size());
  for(const auto& holder : *holders) {
    reply += format_holder_line(holder);
  }
  return reply;
}

std::string IndexService::handle(const ListRequest&, const std::string& origin) {
  auto entries = store_.snapshot();
  log_info(logger_.get(), "[{}] LIST: {} document(s)", origin, entries.size());
  std::string reply = format_ok(entries.size());
  for(const auto& entry : entries) {
    reply += format_entry_line(entry);
  }
  return reply;
}
