// include/OrderingApp.hpp
#pragma once

#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "settings/OutboxSettings.hpp"
#include "settings/CommandSettings.hpp"
#include "settings/MetricsSettings.hpp"

// Ports
#include "ports/input/IMetricsService.hpp"
#include "ports/input/IOrderQueryService.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "ports/output/IOrderRepository.hpp"
#include "ports/output/IOutboxRepository.hpp"
#include "ports/output/IIdempotencyRepository.hpp"

// Application
#include "application/MetricsService.hpp"
#include "application/OrderCommandService.hpp"
#include "application/OrderQueryService.hpp"
#include "application/OutboxRelay.hpp"
#include "application/CommandDispatcher.hpp"
#include "application/InboundEventHandler.hpp"

// Secondary Adapters
#include "adapters/secondary/events/RabbitMQAdapter.hpp"
#include "adapters/secondary/persistence/InMemoryOrderingStore.hpp"
#include "adapters/secondary/persistence/PostgresUnitOfWork.hpp"
#include "adapters/secondary/persistence/PostgresOrderRepository.hpp"
#include "adapters/secondary/persistence/PostgresOutboxRepository.hpp"
#include "adapters/secondary/persistence/PostgresIdempotencyRepository.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

namespace di = boost::di;

namespace ordering
{

    /**
     * @brief Ordering Service Application
     *
     * Принимает: grace_period.*, stock.*, payment.* (из integration.events)
     * Публикует через outbox: order.* (в ordering.events)
     *
     * run() - template method: loadEnvironment() -> configureInjection() -> start(),
     * затем ждёт stop() (SIGINT/SIGTERM).
     */
    class OrderingApp
    {
    public:
        OrderingApp() : stopRequested_(false) { std::cout << "[OrderingApp] Initializing..." << std::endl; }
        ~OrderingApp() { std::cout << "[OrderingApp] Shutting down..." << std::endl; }

        OrderingApp(const OrderingApp &) = delete;
        OrderingApp &operator=(const OrderingApp &) = delete;

        void run(int argc, char *argv[])
        {
            loadEnvironment(argc, argv);
            configureInjection();
            start();

            while (!stopRequested_)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }

            shutdown();
        }

        /**
         * @brief Запросить остановку (безопасно из обработчика сигнала)
         */
        void stop() { stopRequested_ = true; }

        std::shared_ptr<ports::input::IOrderCommandService> commandService() const { return commandService_; }
        std::shared_ptr<ports::input::IOrderQueryService> queryService() const { return queryService_; }

    protected:
        void loadEnvironment(int argc, char *argv[])
        {
            for (int i = 1; i < argc; ++i)
            {
                std::string arg = argv[i];
                if (arg == "--memory")
                {
                    storage_ = "memory";
                }
            }
            if (storage_.empty())
            {
                const char *storage = std::getenv("ORDERING_STORAGE");
                storage_ = storage ? storage : "postgres";
            }
            std::cout << "[OrderingApp] Environment loaded (storage=" << storage_ << ")" << std::endl;
        }

        void configureInjection()
        {
            std::cout << "[OrderingApp] Configuring DI..." << std::endl;

            // Шаг 1: один RabbitMQAdapter для Publisher и Consumer
            auto rabbitInjector = di::make_injector(
                di::bind<settings::RabbitMQSettings>().in(di::singleton));
            rabbitMQAdapter_ = rabbitInjector.create<std::shared_ptr<adapters::secondary::RabbitMQAdapter>>();

            // Шаг 2: хранилище
            if (storage_ == "memory")
            {
                auto clock = std::make_shared<ports::output::SystemClock>();
                auto store = std::make_shared<adapters::secondary::InMemoryOrderingStore>(clock);

                auto injector = di::make_injector(
                    di::bind<ports::output::IClock>().to(clock),
                    di::bind<settings::IOutboxSettings>().to<settings::OutboxSettings>().in(di::singleton),
                    di::bind<settings::ICommandSettings>().to<settings::CommandSettings>().in(di::singleton),
                    di::bind<settings::IMetricsSettings>().to<settings::MetricsSettings>().in(di::singleton),
                    di::bind<ports::input::IMetricsService>().to<application::MetricsService>().in(di::singleton),

                    di::bind<ports::output::IUnitOfWorkFactory>().to(store),
                    di::bind<ports::output::IOrderRepository>().to(store),
                    di::bind<ports::output::IOutboxRepository>().to(store),
                    di::bind<ports::output::IIdempotencyRepository>().to(store),

                    di::bind<ports::output::IEventPublisher>().to(rabbitMQAdapter_),
                    di::bind<ports::output::IEventConsumer>().to(rabbitMQAdapter_));

                wire(injector);
            }
            else
            {
                auto injector = di::make_injector(
                    di::bind<settings::DbSettings>().in(di::singleton),
                    di::bind<ports::output::IClock>().to<ports::output::SystemClock>().in(di::singleton),
                    di::bind<settings::IOutboxSettings>().to<settings::OutboxSettings>().in(di::singleton),
                    di::bind<settings::ICommandSettings>().to<settings::CommandSettings>().in(di::singleton),
                    di::bind<settings::IMetricsSettings>().to<settings::MetricsSettings>().in(di::singleton),
                    di::bind<ports::input::IMetricsService>().to<application::MetricsService>().in(di::singleton),

                    di::bind<ports::output::IUnitOfWorkFactory>()
                        .to<adapters::secondary::PostgresUnitOfWorkFactory>()
                        .in(di::singleton),
                    di::bind<ports::output::IOrderRepository>()
                        .to<adapters::secondary::PostgresOrderRepository>()
                        .in(di::singleton),
                    di::bind<ports::output::IOutboxRepository>()
                        .to<adapters::secondary::PostgresOutboxRepository>()
                        .in(di::singleton),
                    di::bind<ports::output::IIdempotencyRepository>()
                        .to<adapters::secondary::PostgresIdempotencyRepository>()
                        .in(di::singleton),

                    di::bind<ports::output::IEventPublisher>().to(rabbitMQAdapter_),
                    di::bind<ports::output::IEventConsumer>().to(rabbitMQAdapter_));

                wire(injector);
            }

            std::cout << "[OrderingApp] Ready" << std::endl;
        }

        void start()
        {
            dispatcher_->start();

            // RabbitMQ запускаем после регистрации всех подписок
            std::cout << "[OrderingApp] Starting RabbitMQ..." << std::endl;
            rabbitMQAdapter_->start();

            relay_->start();
            std::cout << "[OrderingApp] Started" << std::endl;
        }

        void shutdown()
        {
            // relay публикует через адаптер, диспетчер подтверждает доставки через него:
            // адаптер закрывается последним
            relay_->stop();
            dispatcher_->stop();
            rabbitMQAdapter_->stop();

            std::cout << "[OrderingApp] Metrics:\n" << metrics_->toPrometheusFormat() << std::flush;
        }

    private:
        template <typename Injector>
        void wire(Injector &injector)
        {
            metrics_ = injector.template create<std::shared_ptr<ports::input::IMetricsService>>();
            queryService_ = injector.template create<std::shared_ptr<application::OrderQueryService>>();

            auto commandService = injector.template create<std::shared_ptr<application::OrderCommandService>>();
            relay_ = injector.template create<std::shared_ptr<application::OutboxRelay>>();
            dispatcher_ = injector.template create<std::shared_ptr<application::CommandDispatcher>>();

            // Новые строки outbox сразу будят relay
            std::weak_ptr<application::OutboxRelay> relay = relay_;
            commandService->setCommitListener([relay]()
                                              {
                if (auto r = relay.lock()) {
                    r->notify();
                } });
            commandService_ = commandService;

            // InboundEventHandler вызывает subscribe() в конструкторе
            inboundEventHandler_ = std::make_shared<application::InboundEventHandler>(
                injector.template create<std::shared_ptr<ports::output::IEventConsumer>>(),
                commandService_,
                dispatcher_,
                metrics_);
        }

        std::atomic<bool> stopRequested_;
        std::string storage_;

        std::shared_ptr<adapters::secondary::RabbitMQAdapter> rabbitMQAdapter_;
        std::shared_ptr<ports::input::IMetricsService> metrics_;
        std::shared_ptr<ports::input::IOrderCommandService> commandService_;
        std::shared_ptr<ports::input::IOrderQueryService> queryService_;
        std::shared_ptr<application::OutboxRelay> relay_;
        std::shared_ptr<application::CommandDispatcher> dispatcher_;
        std::shared_ptr<application::InboundEventHandler> inboundEventHandler_;
    };

} // namespace ordering
