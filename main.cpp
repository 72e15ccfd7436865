#include "app/AgentDeckApp.hpp"

int main(int argc, char** argv) {
    agentdeck::app::AgentDeckApp app;
    return app.Run(argc, argv);
}
