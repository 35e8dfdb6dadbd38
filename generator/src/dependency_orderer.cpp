/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>
#include <map>
#include <memory>
#include <set>

#include <peergen/internal/logger.h>

#include "definition_builder.h"
#include "dependency_orderer.h"

namespace peergen
{
    namespace dependency_orderer
    {
        namespace
        {
            enum class mark
            {
                unvisited,
                in_progress,
                placed
            };

            struct frame
            {
                std::size_t index;
                std::vector<std::string> dependencies;
                std::size_t next = 0;
            };
        }

        result order(const definition_list& definitions)
        {
            std::map<std::string, std::size_t> by_name;
            for (std::size_t i = 0; i < definitions.size(); ++i)
            {
                by_name.emplace(definitions[i]->name, i);
            }

            std::vector<mark> marks(definitions.size(), mark::unvisited);
            result output;

            for (std::size_t root = 0; root < definitions.size(); ++root)
            {
                if (by_name.at(definitions[root]->name) != root)
                {
                    PEERGEN_WARN("duplicate definition '{}' dropped", definitions[root]->name);
                    continue;
                }
                if (marks[root] != mark::unvisited)
                    continue;

                std::vector<frame> stack;
                marks[root] = mark::in_progress;
                stack.push_back(frame{root, definitions[root]->dependencies()});

                while (!stack.empty())
                {
                    auto& top = stack.back();
                    if (top.next == top.dependencies.size())
                    {
                        marks[top.index] = mark::placed;
                        output.ordered.push_back(definitions[top.index]);
                        stack.pop_back();
                        continue;
                    }

                    const auto name = top.dependencies[top.next++];
                    auto it = by_name.find(name);
                    if (it == by_name.end())
                        continue; // primitives and opaque names

                    switch (marks[it->second])
                    {
                    case mark::placed:
                        break;
                    case mark::in_progress:
                    {
                        forward_reference ref{definitions[top.index]->name, name};
                        if (std::find(output.forward_references.begin(), output.forward_references.end(), ref)
                            == output.forward_references.end())
                        {
                            PEERGEN_WARN("cyclic reference from {} to {}, accepted as a forward reference", ref.from, ref.to);
                            output.forward_references.push_back(std::move(ref));
                        }
                        break;
                    }
                    case mark::unvisited:
                    {
                        auto index = it->second;
                        marks[index] = mark::in_progress;
                        // top is invalidated by the push
                        stack.push_back(frame{index, definitions[index]->dependencies()});
                        break;
                    }
                    }
                }
            }
            return output;
        }

        definition_list close_cycles(const definition_list& ordered, const std::vector<forward_reference>& references)
        {
            std::map<std::string, std::set<std::string>> back_edges;
            std::set<std::string> targets;
            for (const auto& ref : references)
            {
                back_edges[ref.from].insert(ref.to);
                targets.insert(ref.to);
            }

            definition_list result;
            result.reserve(ordered.size());
            for (const auto& def : ordered)
            {
                auto edges = back_edges.find(def->name);
                bool declare = targets.count(def->name) != 0 && !def->forward_declared;
                if (edges == back_edges.end() && !declare)
                {
                    result.push_back(def);
                    continue;
                }

                auto copy = std::make_shared<definition>(*def);
                if (edges != back_edges.end())
                {
                    // parents stay as they are, a base class has to be complete
                    for (auto& item : copy->fields)
                    {
                        item.type = definition_builder::wrap_forward(item.type, edges->second);
                    }
                    if (copy->kind == definition_kind::alias)
                        copy->bound = definition_builder::wrap_forward(copy->bound, edges->second);
                }
                if (declare)
                    copy->forward_declared = true;
                PEERGEN_DEBUG("{} rewritten to close a cycle", def->name);
                result.push_back(copy);
            }
            return result;
        }
    }
}
