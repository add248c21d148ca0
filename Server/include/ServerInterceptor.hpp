#pragma once

#include <atomic>
#include <chrono>
#include <string>

#include <grpcpp/support/server_interceptor.h>
#include <grpcpp/support/interceptor.h>
#include <grpcpp/grpcpp.h>

#include <spdlog/spdlog.h>

// Logs one line per RPC: successful calls at debug level, failed ones at
// warning level with the status message.
class ServerInterceptor final : public grpc::experimental::Interceptor {
public:
	explicit ServerInterceptor(grpc::experimental::ServerRpcInfo *info,
				   std::shared_ptr<spdlog::logger> logger)
		: info_(info)
		, logger_(std::move(logger))
		, start_(std::chrono::steady_clock::now()) { }

public:
	void Intercept(grpc::experimental::InterceptorBatchMethods *methods) override {
		using grpc::experimental::InterceptionHookPoints;

		if (methods->QueryInterceptionHookPoint(InterceptionHookPoints::POST_RECV_MESSAGE))
			recv_messages_.fetch_add(1, std::memory_order_relaxed);

		if (methods->QueryInterceptionHookPoint(InterceptionHookPoints::PRE_SEND_STATUS))
			LogStatus(methods->GetSendStatus());

		methods->Proceed();
	}

private:
	void LogStatus(const grpc::Status& st) {
		if (!logger_)
			return;

		const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now() - start_).count();
		const std::string method = info_ && info_->method() ? info_->method() : "";
		const int64_t messages = recv_messages_.load(std::memory_order_relaxed);

		if (st.ok()) {
			logger_->debug("[grpc] method={} recv_msgs={} latency_ms={}", method, messages, ms);
			return;
		}

		logger_->warn("[grpc] method={} code={} message=\"{}\" recv_msgs={} latency_ms={}",
			      method, static_cast<int>(st.error_code()), st.error_message(), messages, ms);
	}

private:
	grpc::experimental::ServerRpcInfo *info_;
	std::shared_ptr<spdlog::logger> logger_;

	std::chrono::steady_clock::time_point start_;
	std::atomic<int64_t> recv_messages_{0};
};

class ServerInterceptorFactory final
	: public grpc::experimental::ServerInterceptorFactoryInterface {
public:
	explicit ServerInterceptorFactory(std::shared_ptr<spdlog::logger> logger)
		: logger_(std::move(logger)) { }

	grpc::experimental::Interceptor* CreateServerInterceptor(
		grpc::experimental::ServerRpcInfo *info
	) override
	{
		return new ServerInterceptor(info, logger_);
	}

private:
	std::shared_ptr<spdlog::logger> logger_;
};
