#pragma once

#include "richenum/enum_base.hpp"


namespace richenum::examples {

// -------------------------------------------------------------
// Demo enumeration: order lifecycle
// -------------------------------------------------------------
class OrderStatus final : public EnumBase<OrderStatus> {
public:
    struct Members;

    static const OrderStatus& Pending();
    static const OrderStatus& Paid();
    static const OrderStatus& Shipped();
    static const OrderStatus& Delivered();
    static const OrderStatus& Cancelled();
    static const OrderStatus& Archived();

private:
    explicit OrderStatus(const Definition& def) : EnumBase(def) {}
};

struct OrderStatus::Members {
    OrderStatus pending{{.text = "Pending", .value = 1, .index = 10}};
    OrderStatus paid{{.text = "Paid", .value = 2, .index = 20}};
    OrderStatus shipped{{.oid = oid::parse("3fa85f64-5717-4562-b3fc-2c963f66afa6"), .text = "Shipped", .value = 42, .index = 30}};
    OrderStatus delivered{{.text = "Delivered", .index = 40}};
    OrderStatus cancelled{{.text = "Cancelled", .value = -1, .index = 5}};
    OrderStatus archived{{.text = "Archived", .is_visible = false}};

    Members() { set_default(pending); }
};

inline const OrderStatus& OrderStatus::Pending()   { return members().pending; }
inline const OrderStatus& OrderStatus::Paid()      { return members().paid; }
inline const OrderStatus& OrderStatus::Shipped()   { return members().shipped; }
inline const OrderStatus& OrderStatus::Delivered() { return members().delivered; }
inline const OrderStatus& OrderStatus::Cancelled() { return members().cancelled; }
inline const OrderStatus& OrderStatus::Archived()  { return members().archived; }

} // namespace richenum::examples
