#pragma once

#include <string>

struct UploadError {
	enum class Kind {
		Configuration,
		Precondition,
		Transfer,
		Abort
	};

	Kind kind = Kind::Transfer;
	int code = 0;
	std::string message;
};

const char* UploadErrorKindName(UploadError::Kind kind) noexcept;

UploadError MakeConfigurationError(std::string message);
UploadError MakePreconditionError(std::string message);
UploadError MakeTransferError(int code, std::string message);
