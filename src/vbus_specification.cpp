#include "spec_table.hpp"

namespace vbl {

// Packet layouts of the RESOL controllers seen on the datalogger bus.
// Message id = source << 32 | destination << 16 | command; all packets below
// are addressed to the DFA (0x0010) with command 0x0100.
static const char* kBuiltinSpecification = R"DBC(
VERSION "vbuslog 1"

NS_ :

BS_:

BU_: DFA DeltaSol_BS_Plus DeltaSol_BS_2009 DeltaSol_MX DeltaSol_MX_WMZ

BO_ 72709502402816 DeltaSol_BS_Plus: 28 DeltaSol_BS_Plus
 SG_ Temperature_S1 : 0|16@1- (0.1,0) [-3276.8|3276.7] "°C" DFA
 SG_ Temperature_S2 : 16|16@1- (0.1,0) [-3276.8|3276.7] "°C" DFA
 SG_ Temperature_S3 : 32|16@1- (0.1,0) [-3276.8|3276.7] "°C" DFA
 SG_ Temperature_S4 : 48|16@1- (0.1,0) [-3276.8|3276.7] "°C" DFA
 SG_ Pump_speed_R1 : 64|8@1+ (1,0) [0|100] "%" DFA
 SG_ Pump_speed_R2 : 72|8@1+ (1,0) [0|100] "%" DFA
 SG_ Relay_mask : 80|8@1+ (1,0) [0|255] "" DFA
 SG_ Error_mask : 88|8@1+ (1,0) [0|255] "" DFA
 SG_ System_time : 96|16@1+ (1,0) [0|1439] "min" DFA
 SG_ Scheme : 112|8@1+ (1,0) [0|255] "" DFA
 SG_ Option_flags : 120|8@1+ (1,0) [0|255] "" DFA
 SG_ Operating_hours_R1 : 128|16@1+ (1,0) [0|65535] "h" DFA
 SG_ Operating_hours_R2 : 144|16@1+ (1,0) [0|65535] "h" DFA
 SG_ Heat_quantity_Wh : 160|16@1+ (1,0) [0|999] "Wh" DFA
 SG_ Heat_quantity_kWh : 176|16@1+ (1,0) [0|999] "kWh" DFA
 SG_ Heat_quantity_MWh : 192|16@1+ (1,0) [0|65535] "MWh" DFA
 SG_ Version : 208|16@1+ (0.01,0) [0|655.35] "" DFA

BO_ 73096049459456 DeltaSol_BS_2009: 36 DeltaSol_BS_2009
 SG_ Temperature_S1 : 0|16@1- (0.1,0) [-3276.8|3276.7] "°C" DFA
 SG_ Temperature_S2 : 16|16@1- (0.1,0) [-3276.8|3276.7] "°C" DFA
 SG_ Temperature_S3 : 32|16@1- (0.1,0) [-3276.8|3276.7] "°C" DFA
 SG_ Temperature_S4 : 48|16@1- (0.1,0) [-3276.8|3276.7] "°C" DFA
 SG_ Pump_speed_R1 : 64|8@1+ (1,0) [0|100] "%" DFA
 SG_ Operating_hours_R1 : 80|16@1+ (1,0) [0|65535] "h" DFA
 SG_ Pump_speed_R2 : 96|8@1+ (1,0) [0|100] "%" DFA
 SG_ Operating_hours_R2 : 112|16@1+ (1,0) [0|65535] "h" DFA
 SG_ Unit_type : 128|8@1+ (1,0) [0|255] "" DFA
 SG_ System : 136|8@1+ (1,0) [0|255] "" DFA
 SG_ Error_mask : 160|16@1+ (1,0) [0|65535] "" DFA
 SG_ System_time : 176|16@1+ (1,0) [0|1439] "min" DFA
 SG_ Status_mask : 192|32@1+ (1,0) [0|4294967295] "" DFA
 SG_ Heat_quantity : 224|32@1+ (1,0) [0|4294967295] "Wh" DFA
 SG_ Version : 256|16@1+ (0.01,0) [0|655.35] "" DFA

BO_ 138611480592640 DeltaSol_MX: 24 DeltaSol_MX
 SG_ Temperature_S1 : 0|16@1- (0.1,0) [-3276.8|3276.7] "°C" DFA
 SG_ Temperature_S2 : 16|16@1- (0.1,0) [-3276.8|3276.7] "°C" DFA
 SG_ Temperature_S3 : 32|16@1- (0.1,0) [-3276.8|3276.7] "°C" DFA
 SG_ Temperature_S4 : 48|16@1- (0.1,0) [-3276.8|3276.7] "°C" DFA
 SG_ Temperature_S5 : 64|16@1- (0.1,0) [-3276.8|3276.7] "°C" DFA
 SG_ Temperature_S6 : 80|16@1- (0.1,0) [-3276.8|3276.7] "°C" DFA
 SG_ Pump_speed_R1 : 96|8@1+ (1,0) [0|100] "%" DFA
 SG_ Pump_speed_R2 : 104|8@1+ (1,0) [0|100] "%" DFA
 SG_ Pump_speed_R3 : 112|8@1+ (1,0) [0|100] "%" DFA
 SG_ Pump_speed_R4 : 120|8@1+ (1,0) [0|100] "%" DFA
 SG_ Relay_mask : 128|32@1+ (1,0) [0|4294967295] "" DFA
 SG_ Error_mask : 160|16@1+ (1,0) [0|65535] "" DFA
 SG_ Version : 176|16@1+ (0.01,0) [0|655.35] "" DFA

BO_ 138680200069376 DeltaSol_MX_WMZ: 16 DeltaSol_MX_WMZ
 SG_ Temperature_flow : 0|16@1- (0.1,0) [-3276.8|3276.7] "°C" DFA
 SG_ Temperature_return : 16|16@1- (0.1,0) [-3276.8|3276.7] "°C" DFA
 SG_ Flow_rate : 32|16@1+ (1,0) [0|65535] "l/h" DFA
 SG_ Heat_quantity : 64|32@1+ (1,0) [0|4294967295] "Wh" DFA
 SG_ Power : 96|32@1+ (0.1,0) [0|429496729.5] "W" DFA
)DBC";

std::unique_ptr<SpecificationTable> load_builtin_specification(std::string* err) {
    return SpecificationTable::from_string(kBuiltinSpecification, err);
}

} // namespace vbl
