#include "errors.hpp"

namespace eventstore::util {

void ThrowIfRegistryError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::Conflict:
      throw ConflictError(message);
    default:
      throw RegistryError(result.code, message);
  }
}

} // namespace eventstore::util
