#pragma once

#include <boost/optional.hpp>
#include <qng/common/errors.hpp>
#include <qng/evm/client.hpp>
#include <qng/evm/userop.hpp>

namespace qng
{
// Scans UserOperationEvent logs of the entry point over the last block range
// blocks. Not found is an empty result, not an error.
qng::Error FindUserOperationEvent(const qng::EthClient&,
                                  const qng::uint256_union&,
                                  const qng::EvmAddress&, uint64_t,
                                  boost::optional<qng::EvmLog>&);

qng::Error GetUserOperationReceipt(
    const qng::EthClient&, const qng::uint256_union&, const qng::EvmAddress&,
    uint64_t, boost::optional<qng::UserOperationReceipt>&);

qng::Error GetUserOperationByHash(const qng::EthClient&,
                                  const qng::uint256_union&,
                                  const qng::EvmAddress&, uint64_t, uint64_t,
                                  boost::optional<qng::HashLookupResult>&);
}  // namespace qng
