#include "inventory_service.hpp"
#include "larder/codec.hpp"
#include "larder/errors.hpp"
#include "larder/logging.hpp"

namespace larder {
namespace server {

namespace {

constexpr const char* INVENTORY_DOMAIN = "inventory";

} // anonymous namespace

StockPayload from_proto(const api::StockPayload& payload) {
    StockPayload result;
    result.amount = payload.amount();
    return result;
}

template<typename Fn>
grpc::Status InventoryServiceImpl::run(const char* operation, uint64_t id, Fn&& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (halted_) {
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, "Store halted after a fatal error");
    }
    log_info(INVENTORY_DOMAIN, operation, {{"id", id}});
    try {
        fn();
        return grpc::Status::OK;
    } catch (const LarderError& e) {
        if (e.is_fatal()) {
            halted_ = true;
            log_error(INVENTORY_DOMAIN, "operation_failed", {{"operation", operation}, {"id", id}, {"error", e.what()}});
        } else {
            log_info(INVENTORY_DOMAIN, "operation_rejected", {{"operation", operation}, {"id", id}, {"error", e.what()}});
        }
        return e.to_grpc_status();
    } catch (const std::exception& e) {
        halted_ = true;
        log_error(INVENTORY_DOMAIN, "operation_failed", {{"operation", operation}, {"id", id}, {"error", e.what()}});
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

grpc::Status InventoryServiceImpl::GetProduct(grpc::ServerContext* context,
                                              const api::ProductId* request,
                                              api::ProductRecord* response) {
    return run("get_product", request->id(), [&] {
        *response = codec::to_record(inventory_.get_product(request->id()));
    });
}

grpc::Status InventoryServiceImpl::GetStock(grpc::ServerContext* context,
                                            const api::ProductId* request,
                                            api::Stock* response) {
    return run("get_stock", request->id(), [&] {
        response->set_id(request->id());
        response->set_quantity(inventory_.get_stock(request->id()));
    });
}

grpc::Status InventoryServiceImpl::AddProduct(grpc::ServerContext* context,
                                              const api::ProductPayload* request,
                                              api::ProductRecord* response) {
    return run("add_product", 0, [&] {
        auto product = inventory_.add_product(codec::from_wire(*request));
        log_info(INVENTORY_DOMAIN, "product_added",
            {{"id", product.id}, {"name", product.name},
             {"category", category_name(product.category)}, {"quantity", product.quantity}});
        *response = codec::to_record(product);
    });
}

grpc::Status InventoryServiceImpl::UpdateProduct(grpc::ServerContext* context,
                                                 const api::UpdateProductRequest* request,
                                                 api::ProductRecord* response) {
    return run("update_product", request->id(), [&] {
        *response = codec::to_record(
            inventory_.update_product(request->id(), request->payload()));
    });
}

grpc::Status InventoryServiceImpl::AddQuantity(grpc::ServerContext* context,
                                               const api::StockRequest* request,
                                               api::ProductRecord* response) {
    return run("add_quantity", request->id(), [&] {
        *response = codec::to_record(
            inventory_.add_quantity(request->id(), from_proto(request->payload())));
    });
}

grpc::Status InventoryServiceImpl::OffloadQuantity(grpc::ServerContext* context,
                                                   const api::StockRequest* request,
                                                   api::ProductRecord* response) {
    return run("offload_quantity", request->id(), [&] {
        *response = codec::to_record(
            inventory_.offload_quantity(request->id(), from_proto(request->payload())));
    });
}

grpc::Status InventoryServiceImpl::RemoveProduct(grpc::ServerContext* context,
                                                 const api::ProductId* request,
                                                 api::ProductRecord* response) {
    return run("remove_product", request->id(), [&] {
        *response = codec::to_record(inventory_.remove_product(request->id()));
    });
}

} // namespace server
} // namespace larder
