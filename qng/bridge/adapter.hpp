#pragma once

#include <memory>
#include <string>
#include <qng/bridge/cross.hpp>
#include <qng/bridge/invoker.hpp>
#include <qng/common/errors.hpp>

namespace qng
{
// qng_* methods of the qng node plus cross send through the bridge. The
// bridge is optional; without one CrossSend fails.
class RpcAdapter
{
public:
    RpcAdapter(const std::shared_ptr<qng::JsonRpcInvoker>&,
               const std::shared_ptr<qng::CrossChainBridge>&);

    qng::Error GetBalance(const std::string&, int64_t, qng::Json&) const;
    qng::Error AddBalance(const std::string&, qng::Json&) const;
    qng::Error GetUtxos(const std::string&, int64_t, bool, qng::Json&) const;
    qng::Error SendRawTransaction(const std::string&, bool, qng::Json&) const;
    qng::Error CrossSend(const std::string&, uint32_t, uint64_t,
                         const std::string&, std::string&) const;
    bool BridgeConfigured() const;

private:
    std::shared_ptr<qng::JsonRpcInvoker> invoker_;
    std::shared_ptr<qng::CrossChainBridge> bridge_;
};
}  // namespace qng
