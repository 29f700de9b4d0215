#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>

#include "inventory_service.hpp"
#include "larder/config.hpp"
#include "larder/errors.hpp"
#include "larder/inventory.hpp"
#include "larder/logging.hpp"
#include "larder/state.hpp"
#include "larder/storage/file_backend.hpp"

int main(int argc, char** argv) {
    larder::Config config;
    try {
        config = larder::Config::load(argc, argv);
    } catch (const larder::ConfigError& e) {
        larder::log_error("server", "invalid_configuration", {{"error", e.what()}});
        return 2;
    }

    std::unique_ptr<larder::storage::FileBackend> backend;
    try {
        backend = std::make_unique<larder::storage::FileBackend>(config.data_dir);
    } catch (const larder::StorageError& e) {
        larder::log_error("server", "storage_open_failed",
            {{"data_dir", config.data_dir.string()}, {"error", e.what()}});
        return 1;
    }

    larder::State state(*backend);
    larder::Inventory inventory(state);
    larder::server::InventoryServiceImpl service(inventory);

    grpc::EnableDefaultHealthCheckService(true);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(config.server_address(), grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        larder::log_error("server", "server_start_failed", {{"address", config.server_address()}});
        return 1;
    }

    larder::log_info("server", "inventory_server_started",
        {{"address", config.server_address()},
         {"data_dir", config.data_dir.string()},
         {"products", state.products.size()},
         {"last_id", state.ids.current()}});

    server->Wait();
    return 0;
}
