#include "UploadError.hpp"

const char* UploadErrorKindName(UploadError::Kind kind) noexcept
{
	switch (kind) {
	case UploadError::Kind::Configuration: return "configuration";
	case UploadError::Kind::Precondition:  return "precondition";
	case UploadError::Kind::Transfer:      return "transfer";
	case UploadError::Kind::Abort:         return "abort";
	}

	return "unknown";
}

UploadError MakeConfigurationError(std::string message)
{
	return UploadError{ UploadError::Kind::Configuration, -1, std::move(message) };
}

UploadError MakePreconditionError(std::string message)
{
	return UploadError{ UploadError::Kind::Precondition, -1, std::move(message) };
}

UploadError MakeTransferError(int code, std::string message)
{
	return UploadError{ UploadError::Kind::Transfer, code, std::move(message) };
}
