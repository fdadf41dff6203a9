#include <qng/qng_bridge/daemon.hpp>

#include <iostream>
#include <boost/asio.hpp>
#include <qng/bridge/adapter.hpp>
#include <qng/bridge/cross.hpp>
#include <qng/bridge/invoker.hpp>
#include <qng/bridge/providers.hpp>
#include <qng/common/log.hpp>
#include <qng/common/runner.hpp>
#include <qng/evm/client.hpp>
#include <qng/evm/gas.hpp>
#include <qng/evm/signer.hpp>
#include <qng/qng_bridge/config.hpp>
#include <qng/qng_bridge/service.hpp>
#include <qng/secure/util.hpp>

namespace
{
std::string const CONFIG_FILE = "qng_bridge_config.json";

qng::ErrorCode MakeBridge(qng::BridgeConfig& config,
                          const std::shared_ptr<qng::EthClient>& client,
                          std::shared_ptr<qng::CrossChainBridge>& bridge)
{
    if (!config.BridgeEnabled())
    {
        return qng::ErrorCode::SUCCESS;
    }

    if (config.private_key_.empty())
    {
        qng::SecretInput input;
        input.Input("Enter the private key of the MeerChange sender: ");
        config.private_key_ = input.Get();
    }

    auto eoa = std::make_shared<qng::Eoa>();
    qng::ErrorCode error_code = eoa->Init(config.private_key_);
    qng::SecureClearString(config.private_key_);
    IF_NOT_SUCCESS_RETURN(error_code);

    bridge = std::make_shared<qng::CrossChainBridge>(
        eoa, client, config.meerchange_, config.chain_id_);
    std::cout << "Cross send enabled, sender " << eoa->Address().StringHex()
              << std::endl;
    return qng::ErrorCode::SUCCESS;
}
}  // namespace

qng::ErrorCode qng::Daemon::Run(const boost::filesystem::path& data_path)
{
    try
    {
        qng::BridgeConfig config;
        boost::filesystem::path config_path = data_path / CONFIG_FILE;
        std::fstream config_file;
        qng::ErrorCode error_code =
            qng::FetchObject(config, config_path, config_file);
        config_file.close();
        IF_NOT_SUCCESS_RETURN(error_code);

        if ((config.qng_url_.Ssl() || config.eth_url_.Ssl())
            && !boost::filesystem::exists("cacert.pem"))
        {
            std::cout << "Warning: cacert.pem is missing, the system "
                         "certificate store is used"
                      << std::endl;
        }

        qng::Log::Init(data_path, config.log_);

        auto qng_invoker = std::make_shared<qng::JsonRpcInvoker>(config.qng_url_);
        auto eth_invoker = std::make_shared<qng::JsonRpcInvoker>(config.eth_url_);
        auto client = std::make_shared<qng::EthClient>(eth_invoker);

        std::shared_ptr<qng::CrossChainBridge> bridge;
        error_code = MakeBridge(config, client, bridge);
        IF_NOT_SUCCESS_RETURN(error_code);

        auto adapter = std::make_shared<qng::RpcAdapter>(qng_invoker, bridge);
        auto estimator = std::make_shared<qng::RpcGasEstimator>(client);
        qng::Providers providers = qng::MakeProviders(
            config.providers_, client, estimator, qng::GasOverhead(),
            config.chain_id_, config.max_gas_limit_, config.tracer_);
        qng::BridgeService bridge_service(config, adapter, providers);

        if (!config.rpc_.enable_)
        {
            return qng::ErrorCode::RPC_DISABLED;
        }

        boost::asio::io_service service;
        std::unique_ptr<qng::Rpc> rpc = qng::MakeRpc(
            service, config.rpc_, bridge_service.RpcHandlerMaker());
        if (rpc == nullptr || rpc->Start())
        {
            std::cout << "Error: failed to start rpc on port "
                      << config.rpc_.port_ << std::endl;
            return qng::ErrorCode::RPC_START;
        }
        qng::Log::Rpc(qng::ToString("RPC listening on ",
                                    config.rpc_.address_.to_string(), ":",
                                    rpc->Port()));

        qng::ServiceRunner runner(service, config.io_threads_);
        runner.Join();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error while running bridge (" << e.what() << ")\n";
        return qng::ErrorCode::GENERIC;
    }

    return qng::ErrorCode::SUCCESS;
}

qng::ErrorCode qng::CreateConfig(const boost::filesystem::path& data_path)
{
    boost::filesystem::path config_path = data_path / CONFIG_FILE;
    if (boost::filesystem::exists(config_path))
    {
        return qng::ErrorCode::CONFIG_EXISTS;
    }

    qng::BridgeConfig config;
    std::fstream config_file;
    qng::ErrorCode error_code =
        qng::WriteObject(config, config_path, config_file);
    config_file.close();
    IF_NOT_SUCCESS_RETURN(error_code);

    std::cout << "Config created: " << config_path.string() << std::endl;
    return qng::ErrorCode::SUCCESS;
}
