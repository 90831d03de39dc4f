#include <catch2/catch.hpp>

#if __INTELLISENSE__
#pragma diag_suppress 2486
#endif

#include <engine/aggregate.hpp>
#include <annot/annotations.hpp>
#include <sstream>

using namespace moordns;

namespace test {

static Container fakeContainer(const std::string& netName, const std::string& ip, const LabelMap& labels){
	Container c;
	c.id = "c-" + ip;
	c.labels = labels;
	c.networks[netName] = NetworkAttachment{ip, "172.17.0.1"};
	return c;
}

static Endpoint record(const std::string& name, Targets targets, RecordType type, TTL ttl){
	Endpoint ep;
	ep.dnsName = name;
	ep.targets = std::move(targets);
	ep.recordType = type;
	ep.recordTTL = ttl;
	return ep;
}

static const LabelMap standaloneLabels{
	{"maintainer", "Author Name <author@example.local>"},
	{annot::HOSTNAME_KEY, "gateway.example.local"},
};
static const LabelMap composeExplicitLabels{
	{annot::HOSTNAME_KEY, "whoami.example.local"},
	{annot::TARGET_KEY, "gateway.example.local"},
	{annot::TTL_KEY, "1700"},
	{annot::COMPOSE_SERVICE_KEY, "whoami"},
};
static const LabelMap composeFallbackLabels{
	{annot::HOSTNAME_KEY, "whoami-beta.example.local"},
	{annot::TTL_KEY, "1500"},
	{annot::COMPOSE_SERVICE_KEY, "whoami2"},
};
static const LabelMap swarmNoHostLabels{
	{"com.docker.swarm.node.id", ""},
	{annot::SWARM_SERVICE_ID_KEY, "jqz4hrd4c51w164rpvi2fdbqz"},
	{annot::SWARM_SERVICE_NAME_KEY, "whoami-swarm"},
	{"com.docker.swarm.task", ""},
	{"com.docker.swarm.task.id", "6kg7xevr9t0aikjmqmuo7v4w0"},
	{"com.docker.swarm.task.name", "whoami-swarm.1.6kg7xevr9t0aikjmqmuo7v4w0"},
};
static const LabelMap swarmLabels{
	{annot::HOSTNAME_KEY, "whoami-swarm.example.local"},
	{"com.docker.swarm.node.id", ""},
	{annot::SWARM_SERVICE_ID_KEY, "2xbz9m0akcoggmuna2dajn334"},
	{annot::SWARM_SERVICE_NAME_KEY, "whoami-swarm2"},
	{"com.docker.swarm.task", ""},
	{"com.docker.swarm.task.id", "xtxtix54ryv067h0k787e1mo4"},
	{"com.docker.swarm.task.name", "whoami-swarm2.1.xtxtix54ryv067h0k787e1mo4"},
};

static ServiceMap swarmServices(){
	ServiceMap services;
	std::vector<ServicePort> ports{{"tcp", 5000, 5000, "ingress"}};
	services["jqz4hrd4c51w164rpvi2fdbqz"] = ServiceDescriptor{"jqz4hrd4c51w164rpvi2fdbqz", "whoami-swarm", "vip", ports, {{"l4iiksjxu99m6ebxbgwtosatq", "10.0.0.3/24"}}};
	services["2xbz9m0akcoggmuna2dajn334"] = ServiceDescriptor{"2xbz9m0akcoggmuna2dajn334", "whoami-swarm2", "vip", ports, {{"l4iiksjxu99m6ebxbgwtosatq", "10.0.0.6/24"}}};
	return services;
}

static std::vector<Container> composeAndStandalone(){
	return {
		fakeContainer("bridge", "172.17.0.2", standaloneLabels),

		fakeContainer("ns_default", "172.18.0.2", composeExplicitLabels),
		fakeContainer("ns_default", "172.18.0.3", composeExplicitLabels),
		fakeContainer("ns_default", "172.18.0.4", composeExplicitLabels),

		fakeContainer("ns_default", "172.19.0.2", composeFallbackLabels),
		fakeContainer("ns_default", "172.19.0.3", composeFallbackLabels),
		fakeContainer("ns_default", "172.19.0.4", composeFallbackLabels),
	};
}

static std::vector<Container> swarmTasks(){
	return {
		fakeContainer("ingress", "10.0.0.4", swarmNoHostLabels),
		fakeContainer("ingress", "10.0.0.5", swarmNoHostLabels),

		fakeContainer("ingress", "10.0.0.6", swarmLabels),
		fakeContainer("ingress", "10.0.0.7", swarmLabels),
	};
}

SCENARIO("Standalone and compose containers", "[aggregate]"){
	GIVEN("a standalone container, an explicit target compose service and a network compose service"){
		auto containers = composeAndStandalone();
		WHEN("resolving outside swarm mode"){
			auto eps = endpointsFromContainers(containers, nullptr, log::discard());
			THEN("one record per hostname, groups merged into their representative"){
				REQUIRE(eps == std::vector<Endpoint>{
					record("gateway.example.local", {"172.17.0.2"}, RecordType::A, 0),
					record("whoami.example.local", {"gateway.example.local"}, RecordType::CNAME, 1700),
					record("whoami-beta.example.local", {"172.19.0.2", "172.19.0.3", "172.19.0.4"}, RecordType::A, 1500),
				});
			}
		}
	}
}

SCENARIO("Swarm service tasks", "[aggregate][swarm]"){
	auto containers = composeAndStandalone();
	for(auto&& c : swarmTasks()) containers.push_back(std::move(c));
	auto services = swarmServices();
	GIVEN("swarm tasks next to compose and standalone containers"){
		WHEN("resolving in swarm mode"){
			auto eps = endpointsFromContainers(containers, &services, log::discard());
			THEN("each listed service with a hostname yields one record over its task addresses"){
				REQUIRE(eps == std::vector<Endpoint>{
					record("gateway.example.local", {"172.17.0.2"}, RecordType::A, 0),
					record("whoami.example.local", {"gateway.example.local"}, RecordType::CNAME, 1700),
					record("whoami-beta.example.local", {"172.19.0.2", "172.19.0.3", "172.19.0.4"}, RecordType::A, 1500),
					record("whoami-swarm.example.local", {"10.0.0.6", "10.0.0.7"}, RecordType::A, 0),
				});
			}
		}
		WHEN("resolving in swarm mode without a descriptor for the service"){
			services.erase("2xbz9m0akcoggmuna2dajn334");
			auto eps = endpointsFromContainers(containers, &services, log::discard());
			THEN("the whole group is dropped"){
				REQUIRE(eps.size() == 3);
				for(const auto& ep : eps) REQUIRE(ep.dnsName != "whoami-swarm.example.local");
			}
		}
		WHEN("resolving outside swarm mode"){
			auto eps = endpointsFromContainers(containers, nullptr, log::discard());
			THEN("swarm labels do not group, tasks with a hostname stand alone"){
				REQUIRE(eps == std::vector<Endpoint>{
					record("gateway.example.local", {"172.17.0.2"}, RecordType::A, 0),
					record("whoami-swarm.example.local", {"10.0.0.6"}, RecordType::A, 0),
					record("whoami-swarm.example.local", {"10.0.0.7"}, RecordType::A, 0),
					record("whoami.example.local", {"gateway.example.local"}, RecordType::CNAME, 1700),
					record("whoami-beta.example.local", {"172.19.0.2", "172.19.0.3", "172.19.0.4"}, RecordType::A, 1500),
				});
			}
		}
	}
	GIVEN("swarm tasks without hostnames only"){
		std::vector<Container> tasks{
			fakeContainer("ingress", "10.0.0.4", swarmNoHostLabels),
			fakeContainer("ingress", "10.0.0.5", swarmNoHostLabels),
		};
		auto swarm = GENERATE(true, false);
		CAPTURE(swarm);
		THEN("nothing is published"){
			REQUIRE(endpointsFromContainers(tasks, swarm ? &services : nullptr, log::discard()).empty());
		}
	}
	GIVEN("a task carrying both swarm and compose labels"){
		auto labels = swarmLabels;
		labels[annot::COMPOSE_SERVICE_KEY] = "whoami3";
		std::vector<Container> tasks{
			fakeContainer("ingress", "10.0.0.6", labels),
			fakeContainer("ingress", "10.0.0.7", labels),
		};
		WHEN("outside swarm mode"){
			auto eps = endpointsFromContainers(tasks, nullptr, log::discard());
			THEN("it falls back to compose grouping"){
				REQUIRE(eps == std::vector<Endpoint>{record("whoami-swarm.example.local", {"10.0.0.6", "10.0.0.7"}, RecordType::A, 0)});
			}
		}
	}
}

SCENARIO("Containers without a resolvable target", "[aggregate]"){
	GIVEN("containers with a hostname but no explicit target and no single network"){
		LabelMap labels{{annot::HOSTNAME_KEY, "lost.example.local"}};
		Container none;
		none.labels = labels;
		Container many = fakeContainer("bridge", "172.17.0.9", labels);
		many.networks["ns_default"] = NetworkAttachment{"172.18.0.9", "172.18.0.1"};
		auto wrongPref = labels;
		wrongPref[annot::NETWORK_KEY] = "ns_other";
		Container missingPref = fakeContainer("bridge", "172.17.0.10", wrongPref);
		auto composed = labels;
		composed[annot::COMPOSE_SERVICE_KEY] = "lost";
		Container groupedNone;
		groupedNone.labels = composed;
		THEN("no record is emitted"){
			REQUIRE(endpointsFromContainers({none, many, missingPref, groupedNone}, nullptr, log::discard()).empty());
		}
	}
	GIVEN("a container on several networks with a preferred one"){
		LabelMap labels{{annot::HOSTNAME_KEY, "found.example.local"}, {annot::NETWORK_KEY, "ns_default"}};
		Container c = fakeContainer("bridge", "172.17.0.9", labels);
		c.networks["ns_default"] = NetworkAttachment{"172.18.0.9", "172.18.0.1"};
		THEN("the preferred network address is published"){
			REQUIRE(endpointsFromContainers({c}, nullptr, log::discard()) == std::vector<Endpoint>{record("found.example.local", {"172.18.0.9"}, RecordType::A, 0)});
		}
	}
}

SCENARIO("Malformed TTL", "[aggregate]"){
	GIVEN("a compose group whose first member has a malformed ttl"){
		auto bad = composeFallbackLabels;
		bad[annot::TTL_KEY] = "soon";
		std::vector<Container> containers{
			fakeContainer("ns_default", "172.19.0.2", bad),
			fakeContainer("ns_default", "172.19.0.3", composeFallbackLabels),
			fakeContainer("ns_default", "172.19.0.4", composeFallbackLabels),
		};
		std::vector<std::pair<log::Level, std::string>> logged;
		auto sink = [&](log::Level lvl, const std::string& msg){ logged.emplace_back(lvl, msg); };
		auto eps = endpointsFromContainers(containers, nullptr, sink);
		THEN("that container is skipped and the next one represents the group"){
			REQUIRE(eps == std::vector<Endpoint>{record("whoami-beta.example.local", {"172.19.0.3", "172.19.0.4"}, RecordType::A, 1500)});
		}
		THEN("one warning is reported"){
			REQUIRE(logged.size() == 1);
			REQUIRE(logged[0].first == log::Level::Warn);
			REQUIRE(logged[0].second.find("soon") != std::string::npos);
		}
	}
}

SCENARIO("Group merge", "[aggregate]"){
	GIVEN("a representative and siblings with explicit and fallback targets"){
		PendingState rep;
		rep.targets = {"172.20.0.2"};
		rep.hasFallbackTarget = true;
		rep.ttl = 60;
		PendingState explicitSibling;
		explicitSibling.targets = {"gateway.example.local"};
		PendingState fallbackSibling;
		fallbackSibling.targets = {"172.20.0.4"};
		fallbackSibling.hasFallbackTarget = true;
		std::vector<PendingState> members{rep, explicitSibling, fallbackSibling};
		WHEN("merging"){
			auto merged = mergeGroup(members);
			THEN("only fallback sibling targets are appended, in order"){
				REQUIRE(merged.targets == Targets{"172.20.0.2", "172.20.0.4"});
				REQUIRE(merged.ttl == 60);
			}
			THEN("the members are left untouched"){
				REQUIRE(members[0].targets == Targets{"172.20.0.2"});
			}
		}
	}
}

SCENARIO("Resolution is deterministic", "[aggregate]"){
	GIVEN("the same snapshot"){
		auto containers = composeAndStandalone();
		for(auto&& c : swarmTasks()) containers.push_back(std::move(c));
		auto services = swarmServices();
		WHEN("resolving twice"){
			std::ostringstream a, b;
			REQUIRE(serialize(a, endpointsFromContainers(containers, &services, log::discard())).isOk());
			REQUIRE(serialize(b, endpointsFromContainers(containers, &services, log::discard())).isOk());
			THEN("the outputs are byte-identical"){
				REQUIRE(a.str() == b.str());
			}
		}
	}
}

}
