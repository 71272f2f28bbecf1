#ifndef PLONKSHA_PLONK_CONSTRAINT_SYSTEM_HPP_
#define PLONKSHA_PLONK_CONSTRAINT_SYSTEM_HPP_

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "plonksha/plonk/gates.hpp"
#include "plonksha/plonk/lookup_table.hpp"
#include "plonksha/plonk/variable.hpp"

namespace libplonksha {

template<typename FieldT>
class plonk_gate_application {
public:
    // exactly one of gate and table is set
    std::shared_ptr<const plonk_gate<FieldT>> gate;
    std::vector<FieldT> coefficients;
    lookup_table_handle<FieldT> table;
};

template<typename FieldT>
class plonk_trace_row {
public:
    std::optional<plonk_wires> wires;
    std::vector<plonk_gate_application<FieldT>> gates;
};

/**
 * A width-4 PLONK constraint system with custom gates and lookup tables.
 *
 * Each trace step holds four wires and any number of gates applied to them.
 * Several gates sharing a step are emitted as a batch:
 *
 *   cs.begin_gates_batch_for_step();
 *   cs.new_gate_in_batch(gate, coefficients, wires);
 *   cs.apply_single_lookup_gate(wires, table);
 *   cs.end_gates_batch_for_step();
 *
 * In setup mode (witness_generation == false) value closures are never
 * evaluated and every allocated variable stays unassigned, so the same
 * gadget code lays out the circuit with and without a witness.
 */
template<typename FieldT>
class plonk_constraint_system {
private:
    bool witness_generation;
    std::vector<std::optional<FieldT>> values;
    std::vector<plonk_trace_row<FieldT>> rows;
    std::optional<plonk_trace_row<FieldT>> current_step;
    std::optional<plonk_variable> explicit_zero;
    std::map<std::string, lookup_table_handle<FieldT>> tables;

    void set_step_wires(const plonk_wires& wires);
    void push_gate(const std::shared_ptr<const plonk_gate<FieldT>>& gate,
                   const std::vector<FieldT>& coefficients,
                   const plonk_wires& wires);
    bool row_values(size_t i, plonk_row_values<FieldT>& out) const;

public:
    explicit plonk_constraint_system(bool witness_generation = true);

    // this type should never be copied
    plonk_constraint_system(const plonk_constraint_system&) = delete;
    plonk_constraint_system& operator=(const plonk_constraint_system&) = delete;

    bool is_witness_generation() const { return witness_generation; }

    plonk_variable alloc(const std::function<FieldT()>& value);
    plonk_variable get_explicit_zero();

    std::optional<FieldT> get_value(const plonk_variable& var) const;
    void set_value(const plonk_variable& var, const FieldT& value);

    void begin_gates_batch_for_step();
    void allocate_variables_without_gate(const plonk_wires& wires);
    template<typename GateT>
    void new_gate_in_batch(const GateT& gate,
                           const std::vector<FieldT>& coefficients,
                           const plonk_wires& wires);
    void apply_single_lookup_gate(const std::vector<plonk_variable>& wires,
                                  const lookup_table_handle<FieldT>& table);
    void end_gates_batch_for_step();

    template<typename GateT>
    void new_single_gate_for_trace_step(const GateT& gate,
                                        const std::vector<FieldT>& coefficients,
                                        const plonk_wires& wires);

    lookup_table_handle<FieldT> add_table(const lookup_table_handle<FieldT>& table);
    lookup_table_handle<FieldT> get_table(const std::string& name) const;

    bool is_satisfied() const;

    size_t num_variables() const { return values.size(); }
    size_t num_rows() const { return rows.size(); }
    size_t num_gates() const;
    size_t num_lookups() const;
    size_t num_tables() const { return tables.size(); }
};

}

#include "plonksha/plonk/constraint_system.tcc"

#endif // PLONKSHA_PLONK_CONSTRAINT_SYSTEM_HPP_
