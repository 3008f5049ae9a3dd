#include "LedgerError.hpp"
#include <sstream>

namespace lotledger {

std::string_view toString(ErrorKind kind) noexcept
{
    switch (kind) {
    case ErrorKind::InvalidArgument:       return "InvalidArgument";
    case ErrorKind::InsufficientInventory: return "InsufficientInventory";
    case ErrorKind::EditRejected:          return "EditRejected";
    case ErrorKind::NotFound:              return "NotFound";
    case ErrorKind::PersistenceFailure:    return "PersistenceFailure";
    }
    return "Unknown";
}

std::string_view toString(EditRule rule) noexcept
{
    switch (rule) {
    case EditRule::InsufficientAcquisitionQuantity:  return "INSUFFICIENT_ACQUISITION_QUANTITY";
    case EditRule::AcquisitionDateConflict:          return "ACQUISITION_DATE_CONFLICT";
    case EditRule::DisposalDateConflict:             return "DISPOSAL_DATE_CONFLICT";
    case EditRule::TypeChangeInsufficientInventory:  return "TYPE_CHANGE_INSUFFICIENT_INVENTORY";
    case EditRule::TypeChangeMatchedDisposal:        return "TYPE_CHANGE_MATCHED_DISPOSAL";
    case EditRule::InstrumentChangeWithMatches:      return "INSTRUMENT_CHANGE_WITH_MATCHES";
    case EditRule::TypeChangeConsumedAcquisition:    return "TYPE_CHANGE_CONSUMED_ACQUISITION";
    case EditRule::DisposalQuantityExceedsInventory: return "DISPOSAL_QUANTITY_EXCEEDS_INVENTORY";
    case EditRule::DeleteWithMatches:                return "DELETE_WITH_MATCHES";
    }
    return "UNKNOWN_RULE";
}

LedgerError LedgerError::invalidArgument(std::string message)
{
    return LedgerError{ErrorKind::InvalidArgument, std::move(message), 0.0, std::nullopt};
}

LedgerError LedgerError::insufficientInventory(double shortfall, std::string message)
{
    return LedgerError{ErrorKind::InsufficientInventory, std::move(message), shortfall, std::nullopt};
}

LedgerError LedgerError::editRejected(EditRejection rejection)
{
    std::string message = rejection.message;
    return LedgerError{ErrorKind::EditRejected, std::move(message), 0.0, std::move(rejection)};
}

LedgerError LedgerError::notFound(std::string message)
{
    return LedgerError{ErrorKind::NotFound, std::move(message), 0.0, std::nullopt};
}

LedgerError LedgerError::persistence(std::string cause)
{
    return LedgerError{ErrorKind::PersistenceFailure, "Storage error: " + cause, 0.0, std::nullopt};
}

std::string LedgerError::describe() const
{
    std::ostringstream oss;
    oss << toString(kind) << ": " << message;

    if (kind == ErrorKind::InsufficientInventory) {
        oss << " (shortfall " << shortfall << ")";
    }

    if (rejection) {
        oss << " [" << toString(rejection->rule);
        if (!rejection->field.empty()) {
            oss << ", field " << rejection->field;
        }
        if (rejection->boundDate) {
            oss << ", bound " << formatDate(*rejection->boundDate);
        } else {
            oss << ", bound " << rejection->bound;
        }
        oss << "]";
    }

    return oss.str();
}

}  // namespace lotledger
