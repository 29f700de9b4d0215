#pragma once

#include <atomic>
#include <mutex>
#include <grpcpp/grpcpp.h>
#include "larder/inventory.grpc.pb.h"
#include "larder/inventory.hpp"

namespace larder {
namespace server {

/// gRPC front for Inventory. Calls are handled one at a time; after a fatal
/// error every further call is answered with UNAVAILABLE.
class InventoryServiceImpl final : public api::InventoryService::Service {
public:
    explicit InventoryServiceImpl(Inventory& inventory) : inventory_(inventory) {}

    bool halted() const { return halted_; }

    grpc::Status GetProduct(grpc::ServerContext* context,
                            const api::ProductId* request,
                            api::ProductRecord* response) override;

    grpc::Status GetStock(grpc::ServerContext* context,
                          const api::ProductId* request,
                          api::Stock* response) override;

    grpc::Status AddProduct(grpc::ServerContext* context,
                            const api::ProductPayload* request,
                            api::ProductRecord* response) override;

    grpc::Status UpdateProduct(grpc::ServerContext* context,
                               const api::UpdateProductRequest* request,
                               api::ProductRecord* response) override;

    grpc::Status AddQuantity(grpc::ServerContext* context,
                             const api::StockRequest* request,
                             api::ProductRecord* response) override;

    grpc::Status OffloadQuantity(grpc::ServerContext* context,
                                 const api::StockRequest* request,
                                 api::ProductRecord* response) override;

    grpc::Status RemoveProduct(grpc::ServerContext* context,
                               const api::ProductId* request,
                               api::ProductRecord* response) override;

private:
    template<typename Fn>
    grpc::Status run(const char* operation, uint64_t id, Fn&& fn);

    Inventory& inventory_;
    std::mutex mutex_;
    std::atomic<bool> halted_{false};
};

StockPayload from_proto(const api::StockPayload& payload);

} // namespace server
} // namespace larder
