#include <iostream>
#include <string>

#include "pinsim/config/TableLoader.hpp"
#include "pinsim/sim/Simulation.hpp"

namespace
{
void PrintBall(pinsim::sim::Simulation& simulation, pinsim::scene::BallId ball)
{
    const pinsim::physics::BallRecord* record = simulation.Balls().Find(ball);
    if (record == nullptr)
    {
        std::cout << "  ball " << ball << " is gone\n";
        return;
    }
    const pinsim::physics::BallState& state = record->state;
    std::cout << "  ball " << ball << " pos (" << state.position.x << ", " << state.position.y << ", " << state.position.z
              << ") vel (" << state.velocity.x << ", " << state.velocity.y << ", " << state.velocity.z << ")"
              << (state.frozen ? " frozen" : "") << "\n";
}
} // namespace

int main(int argc, char** argv)
{
    const std::string tablePath = argc > 1 ? argv[1] : "assets/tables/demo_table.json";

    pinsim::config::TableDefinition table;
    std::string error;
    if (!pinsim::config::LoadTableFromJsonFile(tablePath, &table, &error))
    {
        std::cout << "pinsim: ERROR - " << error << "\n";
        return 1;
    }

    pinsim::sim::Simulation simulation;
    if (!simulation.Build(table, &error))
    {
        std::cout << "pinsim: ERROR - " << error << "\n";
        return 1;
    }
    simulation.Start();
    std::cout << "pinsim: " << simulation.Colliders().ColliderCount() << " colliders generated\n";

    auto* plunger = simulation.Find<pinsim::devices::PlungerDevice>("Plunger");
    auto* saucer = simulation.Find<pinsim::devices::KickerDevice>("Saucer");

    if (plunger != nullptr)
    {
        plunger->LimitEosEvent().Subscribe([](const pinsim::devices::StrokeEventArgs& args) {
            std::cout << "Plunger: end of stroke, speed " << args.speed << "\n";
        });
        plunger->LimitBosEvent().Subscribe([](const pinsim::devices::StrokeEventArgs& args) {
            std::cout << "Plunger: back at rest, speed " << args.speed << "\n";
        });

        pinsim::wiring::IWireDest* pull = simulation.Signals().ResolveCoil("Plunger", "Pull");
        if (pull != nullptr)
        {
            pull->OnChange(true);
            // the clock only banks a quarter second per call
            for (int i = 0; i < 15; ++i)
            {
                simulation.Advance(0.1);
            }
            std::cout << "Plunger: pulled to ratio " << plunger->StrokeRatio() << "\n";
            pull->OnChange(false);
            simulation.Advance(0.25);
        }
    }

    if (saucer != nullptr)
    {
        saucer->SwitchEvent().Subscribe([](const pinsim::devices::SwitchEventArgs& args) {
            std::cout << "Saucer: switch " << (args.isEnabled ? "on" : "off") << " (ball " << args.ball << ")\n";
        });

        // the auto-eject wire kicks the new ball out right away
        const pinsim::scene::BallId ball = saucer->CreateBall();
        std::cout << "Saucer: created ball " << ball << ", occupied " << (saucer->HasBall() ? "yes" : "no") << "\n";
        PrintBall(simulation, ball);

        simulation.ReportHit(saucer->Id(), ball, true);
        simulation.Balls().DestroyBall(ball);
        simulation.Advance(0.01);
        PrintBall(simulation, ball);
    }

    simulation.Stop();
    return 0;
}
