#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include "omotes/omotes.hpp"
#include "roundtrip_orchestrator.hpp"
#include "simulator_task.hpp"

namespace {

constexpr int kMaxRounds = 100;

}  // namespace

int main(int argc, char** argv) {
    try {
        std::string config_path = argc > 1 ? argv[1]
            : omotes::from_env("WORKFLOW_CONFIG_PATH", "examples/cpp/local-roundtrip/workflow_config.json");

        auto bus = std::make_shared<omotes::InMemoryMessageBus>();
        auto runner = std::make_shared<omotes::InlineTaskRunner>();
        auto manager = std::make_shared<const omotes::WorkflowTypeManager>(
            omotes::WorkflowTypeManager::from_json_config_file(config_path));
        auto worker_config = omotes::WorkerConfig::from_env();

        // Worker side
        omotes::Worker worker(
            omotes::WorkerDefinition{"simulator", roundtrip::run_simulator, worker_config}, bus, runner);
        worker.start();

        // Orchestrator side
        roundtrip::RoundtripOrchestrator orchestrator(
            std::make_shared<omotes::OrchestratorInterface>(bus, manager), runner, worker_config);
        orchestrator.start();

        // Client side
        omotes::OmotesInterface client(bus);
        client.start();

        std::unique_ptr<omotes::WorkflowTypeManager> catalog;
        client.connect_to_available_workflows([&catalog](const omotes::WorkflowTypeManager& received) {
            catalog = std::make_unique<omotes::WorkflowTypeManager>(received);
        });
        bus->run_until_idle();
        if (!catalog) {
            omotes::log_error("client", "no_workflow_catalog");
            return 1;
        }

        const omotes::WorkflowType* simulator = catalog->get_workflow_by_name("simulator");
        if (!simulator) {
            omotes::log_error("client", "unknown_workflow", {{"workflow_type", "simulator"}});
            return 1;
        }

        bool finished = false;
        bool succeeded = false;
        omotes::ParamsDict params{
            {"timestep_count", int64_t{5}},
            {"start_time", omotes::helpers::parse_iso8601("2024-01-01T00:00:00Z")},
            {"mode", std::string("exact")},
        };
        omotes::JobCallbacks callbacks{
            [&](const omotes::Job& job, const omotes::protocol::JobResult& result) {
                finished = true;
                succeeded = result.result_type() == omotes::protocol::JobResult::SUCCEEDED;
                omotes::log_info("client", "job_finished",
                                 {{"job_id", job.id()},
                                  {"succeeded", succeeded},
                                  {"output_esdl", result.output_esdl()}});
            },
            [](const omotes::Job& job, const omotes::protocol::JobProgressUpdate& update) {
                omotes::log_info("client", "job_progress",
                                 {{"job_id", job.id()},
                                  {"progress", update.progress()},
                                  {"message", update.message()}});
            },
            [](const omotes::Job& job, const omotes::protocol::JobStatusUpdate& update) {
                omotes::log_info("client", "job_status",
                                 {{"job_id", job.id()},
                                  {"status", omotes::protocol::JobStatusUpdate::JobStatus_Name(update.status())}});
            },
        };

        omotes::Job job = client.submit_job("<esdl:EnergySystem/>", params, *simulator,
                                            std::chrono::minutes(10), std::move(callbacks));

        for (int round = 0; round < kMaxRounds && !finished; ++round) {
            bus->run_until_idle();
            runner->run_pending();
        }

        if (!finished) {
            omotes::log_error("client", "job_did_not_finish", {{"job_id", job.id()}});
            return 1;
        }
        client.stop();
        return succeeded ? 0 : 1;
    } catch (const omotes::ClientError& e) {
        std::cerr << "omotes error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
}
