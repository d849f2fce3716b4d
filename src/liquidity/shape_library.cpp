#include "liquidity/shape_library.hpp"

#include "ledger/errors.hpp"
#include "ledger/util.hpp"
#include "liquidity/curve_shapes.hpp"

namespace liquidity {

namespace {

std::optional<ledger::CurveShape> find_default(const ledger::LedgerTransaction& txn) {
    for (auto& shape : txn.shapes()) {
        if (shape.is_default) {
            return shape;
        }
    }
    return std::nullopt;
}

} // namespace

ledger::CurveShape save_shape(ledger::LedgerTransaction& txn,
                              const std::string& name,
                              const ledger::ShapeParams& params) {
    if (name.empty()) {
        ledger::throw_error(ledger::ErrorKind::InvalidArgument, "Shape name must not be empty");
    }
    ledger::CurveShape shape;
    shape.name = name;
    shape.params = params;
    shape.points = generate_shape(params);
    shape.id = ledger::make_id("shape", txn.next_sequence());
    shape.is_default = !find_default(txn).has_value();
    shape.updated_at_ms = txn.timestamp_ms();
    txn.put_shape(shape);
    return shape;
}

std::vector<ledger::CurveShape> list_shapes(const ledger::LedgerTransaction& txn) {
    return txn.shapes();
}

ledger::CurveShape get_shape(const ledger::LedgerTransaction& txn, const std::string& shape_id) {
    auto shape = txn.find_shape(shape_id);
    if (!shape) {
        ledger::throw_error(ledger::ErrorKind::NotFound, "Curve shape not found: " + shape_id);
    }
    return *shape;
}

ledger::CurveShape update_shape(ledger::LedgerTransaction& txn,
                                const std::string& shape_id,
                                const ledger::ShapeParams& params,
                                const std::optional<std::string>& name) {
    auto shape = get_shape(txn, shape_id);
    if (name) {
        if (name->empty()) {
            ledger::throw_error(ledger::ErrorKind::InvalidArgument, "Shape name must not be empty");
        }
        shape.name = *name;
    }
    shape.params = params;
    shape.points = generate_shape(params);
    shape.updated_at_ms = txn.timestamp_ms();
    txn.put_shape(shape);
    return shape;
}

ledger::CurveShape set_default_shape(ledger::LedgerTransaction& txn, const std::string& shape_id) {
    auto target = get_shape(txn, shape_id);
    for (auto shape : txn.shapes()) {
        if (shape.is_default && shape.id != shape_id) {
            shape.is_default = false;
            shape.updated_at_ms = txn.timestamp_ms();
            txn.put_shape(shape);
        }
    }
    target.is_default = true;
    target.updated_at_ms = txn.timestamp_ms();
    txn.put_shape(target);
    return target;
}

void delete_shape(ledger::LedgerTransaction& txn, const std::string& shape_id) {
    const auto shape = get_shape(txn, shape_id);
    if (shape.is_default) {
        ledger::throw_error(ledger::ErrorKind::InvalidState,
                            "Cannot delete the default shape '" + shape.name + "'");
    }
    txn.remove_shape(shape_id);
}

ledger::CurveShape ensure_default_shape(ledger::LedgerTransaction& txn) {
    if (auto shape = find_default(txn)) {
        return *shape;
    }
    return save_shape(txn, kDefaultShapeName, ledger::BellParams{});
}

std::vector<ledger::CurvePoint> default_curve(const ledger::LedgerTransaction& txn) {
    if (const auto shape = find_default(txn)) {
        return shape->points;
    }
    return generate_shape(ledger::BellParams{});
}

} // namespace liquidity
