#include "http_client.hpp"
#include "errors/errors.hpp"
#include "logging/log_manager.hpp"
#include <aws/crt/Api.h>
#include <aws/crt/http/HttpConnection.h>
#include <aws/crt/http/HttpRequestResponse.h>
#include <aws/crt/io/Uri.h>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <sstream>

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("deployer.status.HttpClient");

namespace status {

    constexpr static int TIME_OUT_MS = 5000;
    constexpr static uint32_t HTTPS_PORT = 443;
    constexpr static uint32_t HTTP_PORT = 80;

    [[noreturn]] static void fail(const std::string &message) {
        LOG.atError("http-post").logAndThrow(errors::StatusReportError(message));
    }

    HttpResponse CrtHttpClient::post(
        const std::string &url, const HttpHeaders &headers, const std::string &body) {

        auto allocator = Aws::Crt::DefaultAllocator();
        Aws::Crt::ByteCursor urlCursor = Aws::Crt::ByteCursorFromCString(url.c_str());
        Aws::Crt::Io::Uri uri(urlCursor, allocator);
        if(!uri) {
            fail("Invalid URL " + url);
        }
        auto scheme = uri.GetScheme();
        bool secure = std::string_view(reinterpret_cast<const char *>(scheme.ptr), scheme.len)
                      != "http";
        auto hostName = uri.GetHostName();
        uint32_t port = uri.GetPort();
        if(port == 0) {
            port = secure ? HTTPS_PORT : HTTP_PORT;
        }

        std::optional<Aws::Crt::Io::TlsContext> tlsContext;
        std::optional<Aws::Crt::Io::TlsConnectionOptions> tlsConnectionOptions;
        if(secure) {
            Aws::Crt::Io::TlsContextOptions tlsCtxOptions =
                Aws::Crt::Io::TlsContextOptions::InitDefaultClient(allocator);
            tlsContext.emplace(tlsCtxOptions, Aws::Crt::Io::TlsMode::CLIENT, allocator);
            if(tlsContext->GetInitializationError() != AWS_ERROR_SUCCESS) {
                fail("Failed to create TLS context");
            }
            tlsConnectionOptions = tlsContext->NewConnectionOptions();
            tlsConnectionOptions->SetServerName(hostName);
        }

        Aws::Crt::Io::SocketOptions socketOptions;
        socketOptions.SetConnectTimeoutMs(TIME_OUT_MS);

        Aws::Crt::Io::EventLoopGroup eventLoopGroup(0, allocator);
        if(eventLoopGroup.LastError() != AWS_ERROR_SUCCESS) {
            fail("Failed to create event loop group");
        }
        Aws::Crt::Io::DefaultHostResolver defaultHostResolver(eventLoopGroup, 8, 30, allocator);
        if(defaultHostResolver.LastError() != AWS_ERROR_SUCCESS) {
            fail("Failed to create default host resolver");
        }
        Aws::Crt::Io::ClientBootstrap clientBootstrap(
            eventLoopGroup, defaultHostResolver, allocator);
        if(clientBootstrap.LastError() != AWS_ERROR_SUCCESS) {
            fail("Failed to create client bootstrap");
        }
        clientBootstrap.EnableBlockingShutdown();

        std::shared_ptr<Aws::Crt::Http::HttpClientConnection> connection(nullptr);
        bool errorOccurred = true;
        bool connectionShutdown = false;
        int setupError = 0;

        std::condition_variable conditionalVar;
        std::mutex semaphoreLock;

        auto onConnectionSetup =
            [&](const std::shared_ptr<Aws::Crt::Http::HttpClientConnection> &newConnection,
                int errorCode) {
                std::lock_guard<std::mutex> lockGuard(semaphoreLock);
                if(!errorCode) {
                    connection = newConnection;
                    errorOccurred = false;
                } else {
                    setupError = errorCode;
                    connectionShutdown = true;
                }
                conditionalVar.notify_one();
            };

        auto onConnectionShutdown = [&](Aws::Crt::Http::HttpClientConnection &, int errorCode) {
            std::lock_guard<std::mutex> lockGuard(semaphoreLock);
            connectionShutdown = true;
            if(errorCode) {
                errorOccurred = true;
            }
            conditionalVar.notify_one();
        };

        Aws::Crt::Http::HttpClientConnectionOptions connectionOptions;
        connectionOptions.Bootstrap = &clientBootstrap;
        connectionOptions.OnConnectionSetupCallback = onConnectionSetup;
        connectionOptions.OnConnectionShutdownCallback = onConnectionShutdown;
        connectionOptions.SocketOptions = socketOptions;
        if(tlsConnectionOptions.has_value()) {
            connectionOptions.TlsOptions = tlsConnectionOptions.value();
        }
        connectionOptions.HostName =
            std::string(reinterpret_cast<const char *>(hostName.ptr), hostName.len);
        connectionOptions.Port = port;

        std::unique_lock<std::mutex> semaphoreULock(semaphoreLock);
        if(!Aws::Crt::Http::HttpClientConnection::CreateConnection(connectionOptions, allocator)) {
            fail("Failed to create connection");
        }
        conditionalVar.wait(semaphoreULock, [&]() { return connection || connectionShutdown; });

        if(errorOccurred || connectionShutdown || !connection) {
            fail(
                std::string("Failed to establish connection: ")
                + aws_error_debug_str(setupError));
        }

        HttpResponse response;
        bool streamCompleted = false;
        int streamError = 0;

        Aws::Crt::Http::HttpRequest request(allocator);
        request.SetMethod(Aws::Crt::ByteCursorFromCString("POST"));
        request.SetPath(uri.GetPathAndQuery());

        Aws::Crt::Http::HttpHeader hostHeader;
        hostHeader.name = Aws::Crt::ByteCursorFromCString("host");
        hostHeader.value = hostName;
        request.AddHeader(hostHeader);
        for(const auto &[name, value] : headers) {
            Aws::Crt::Http::HttpHeader header;
            header.name = Aws::Crt::ByteCursorFromCString(name.c_str());
            header.value = Aws::Crt::ByteCursorFromCString(value.c_str());
            request.AddHeader(header);
        }
        auto bodyStream = Aws::Crt::MakeShared<std::stringstream>(allocator, body);
        request.SetBody(bodyStream);

        Aws::Crt::Http::HttpRequestOptions requestOptions;
        requestOptions.request = &request;
        requestOptions.onIncomingHeadersBlockDone = nullptr;
        requestOptions.onIncomingHeaders = [&](Aws::Crt::Http::HttpStream &stream,
                                               enum aws_http_header_block,
                                               const Aws::Crt::Http::HttpHeader *,
                                               std::size_t) {
            response.statusCode = stream.GetResponseStatusCode();
        };
        requestOptions.onIncomingBody = [&](Aws::Crt::Http::HttpStream &,
                                            const Aws::Crt::ByteCursor &data) {
            response.body.append(reinterpret_cast<const char *>(data.ptr), data.len);
        };
        requestOptions.onStreamComplete = [&](Aws::Crt::Http::HttpStream &, int errorCode) {
            std::lock_guard<std::mutex> lockGuard(semaphoreLock);
            streamCompleted = true;
            streamError = errorCode;
            conditionalVar.notify_one();
        };

        auto stream = connection->NewClientStream(requestOptions);
        if(!stream || !stream->Activate()) {
            connection->Close();
            conditionalVar.wait(semaphoreULock, [&]() { return connectionShutdown; });
            fail("Failed to activate request stream");
        }

        conditionalVar.wait(semaphoreULock, [&]() { return streamCompleted; });

        connection->Close();
        conditionalVar.wait(semaphoreULock, [&]() { return connectionShutdown; });

        if(streamError) {
            fail(std::string("Request failed: ") + aws_error_debug_str(streamError));
        }
        LOG.atDebug("http-post").kv("url", url).kv("statusCode", response.statusCode).log();
        return response;
    }
} // namespace status
